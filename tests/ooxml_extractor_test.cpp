#include "../libdocmill/include/docx_extractor.hpp"
#include "../libdocmill/include/ooxml_archive.hpp"
#include "../libdocmill/include/xlsx_extractor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace docmill;
using namespace docmill::test;

namespace {

std::string table(const std::vector<std::vector<std::string>>& rows) {
    std::string xml = "<w:tbl>";
    for (const auto& row : rows) {
        xml += "<w:tr>";
        for (const auto& cell : row) {
            xml += "<w:tc>" + (cell.empty() ? std::string("<w:p/>") : word_paragraph(cell)) + "</w:tc>";
        }
        xml += "</w:tr>";
    }
    return xml + "</w:tbl>";
}

const std::string kWorkbook =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
    R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)"
    R"(<sheets><sheet name="Data" sheetId="1" r:id="rId1"/><sheet name="Empty" sheetId="2" r:id="rId2"/>)"
    R"(<sheet name="Notes" sheetId="3" r:id="rId3"/></sheets></workbook>)";

const std::string kWorkbookRels =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="worksheet" Target="worksheets/sheet1.xml"/>)"
    R"(<Relationship Id="rId2" Type="worksheet" Target="worksheets/sheet2.xml"/>)"
    R"(<Relationship Id="rId3" Type="worksheet" Target="/xl/worksheets/sheet3.xml"/>)"
    R"(</Relationships>)";

const std::string kSharedStrings =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" count="3" uniqueCount="3">)"
    R"(<si><t>Item</t></si><si><t>Amount</t></si>)"
    R"(<si><r><t>Wid</t></r><r><t>get</t></r></si></sst>)";

const std::string kSheet1 =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)"
    R"(<row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1" t="s"><v>1</v></c></row>)"
    R"(<row r="2"><c r="A2" t="s"><v>2</v></c><c r="B2"><v>42.5</v></c><c r="C2" t="b"><v>1</v></c></row>)"
    R"(<row r="3"><c r="A3"/></row>)"
    R"(</sheetData></worksheet>)";

const std::string kSheet2 =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData/></worksheet>)";

const std::string kSheet3 =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)"
    R"(<row r="1"><c r="A1" t="inlineStr"><is><t>Checked by finance</t></is></c></row>)"
    R"(</sheetData></worksheet>)";

} // namespace

TEST(DocxExtractorTest, ParagraphsThenTables) {
    const std::string xml = word_document(
        word_paragraph("First paragraph") +
        table({{"Name", "Role"}, {"Alice", ""}}) +
        "<w:p/>" +
        word_paragraph("Second paragraph"));

    std::size_t tables = 0;
    const std::string text = DocxExtractor::render_document_xml(xml, &tables);

    EXPECT_EQ(text, "First paragraph\n\nSecond paragraph\n\n[TABLE]\nName | Role\nAlice\n[/TABLE]");
    EXPECT_EQ(tables, 1u);
}

TEST(DocxExtractorTest, RunContentIsAssembled) {
    const std::string xml = word_document(
        "<w:p><w:r><w:t>a</w:t><w:tab/><w:t>b</w:t><w:br/><w:t>c</w:t></w:r>"
        "<w:del><w:r><w:delText>gone</w:delText></w:r></w:del>"
        "<w:hyperlink><w:r><w:t>-link</w:t></w:r></w:hyperlink></w:p>"
        "<w:sdt><w:sdtContent>" + word_paragraph("inside control") + "</w:sdtContent></w:sdt>");

    EXPECT_EQ(DocxExtractor::render_document_xml(xml), "a\tb\nc-link\n\ninside control");
}

TEST(DocxExtractorTest, MalformedXmlThrows) {
    EXPECT_THROW((void)DocxExtractor::render_document_xml("<w:document><w:body>"), std::runtime_error);
}

TEST(DocxExtractorTest, ExtractsFromPackage) {
    const TempDir dir;
    const auto file = dir.path() / "memo.docx";
    write_zip(file, {
        {"[Content_Types].xml", "<Types/>"},
        {"word/document.xml", word_document(word_paragraph("Hello from a memo.") +
                                            table({{"Q1", "100"}}))},
        {"word/styles.xml", "<w:styles/>"},
    });

    const DocxExtractor extractor;
    const auto result = extractor.extract(file);

    EXPECT_EQ(result.text, "Hello from a memo.\n\n[TABLE]\nQ1 | 100\n[/TABLE]");
    EXPECT_EQ(result.units, 1u);
    EXPECT_EQ(result.method, "ooxml");
}

TEST(DocxExtractorTest, NonZipFileYieldsEmptyText) {
    const TempDir dir;
    const auto file = dir.write("broken.docx", "this is not a zip archive");

    const DocxExtractor extractor;
    EXPECT_TRUE(extractor.extract(file).text.empty());
}

TEST(XlsxExtractorTest, SheetsRenderedInWorkbookOrder) {
    const TempDir dir;
    const auto file = dir.path() / "book.xlsx";
    write_zip(file, {
        {"[Content_Types].xml", "<Types/>"},
        {"xl/workbook.xml", kWorkbook},
        {"xl/_rels/workbook.xml.rels", kWorkbookRels},
        {"xl/sharedStrings.xml", kSharedStrings},
        {"xl/worksheets/sheet1.xml", kSheet1},
        {"xl/worksheets/sheet2.xml", kSheet2},
        {"xl/worksheets/sheet3.xml", kSheet3},
    });

    const XlsxExtractor extractor;
    const auto result = extractor.extract(file);

    EXPECT_EQ(result.text,
              "[SHEET: Data]\nItem | Amount\nWidget | 42.5 | TRUE\n\n"
              "[SHEET: Notes]\nChecked by finance");
    EXPECT_EQ(result.units, 2u);
    EXPECT_EQ(result.method, "ooxml");
}

TEST(XlsxExtractorTest, DateStyledCellsRenderAsDates) {
    const std::string workbook =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
        R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)"
        R"(<sheets><sheet name="Dates" sheetId="1" r:id="rId1"/></sheets></workbook>)";
    const std::string rels =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
        R"(<Relationship Id="rId1" Type="worksheet" Target="worksheets/sheet1.xml"/></Relationships>)";
    // xf 0 General, 1 built-in date (14), 2 custom date, 3 custom currency, 4 built-in time (21)
    const std::string styles =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<styleSheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">)"
        R"(<numFmts count="2"><numFmt numFmtId="164" formatCode="dd/mm/yyyy\ hh:mm"/>)"
        R"(<numFmt numFmtId="165" formatCode="&quot;Days &quot;#,##0.00"/></numFmts>)"
        R"(<cellXfs count="5"><xf numFmtId="0"/><xf numFmtId="14"/><xf numFmtId="164"/>)"
        R"(<xf numFmtId="165"/><xf numFmtId="21"/></cellXfs></styleSheet>)";
    const std::string sheet =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)"
        R"(<row r="1"><c r="A1" s="1"><v>45306</v></c><c r="B1" s="2"><v>45306.5</v></c></row>)"
        R"(<row r="2"><c r="A2" s="3"><v>45306</v></c><c r="B2"><v>45306</v></c>)"
        R"(<c r="C2" s="4"><v>0.75</v></c></row>)"
        R"(</sheetData></worksheet>)";

    const TempDir dir;
    const auto file = dir.path() / "dates.xlsx";
    write_zip(file, {
        {"xl/workbook.xml", workbook},
        {"xl/_rels/workbook.xml.rels", rels},
        {"xl/styles.xml", styles},
        {"xl/worksheets/sheet1.xml", sheet},
    });

    const XlsxExtractor extractor;
    EXPECT_EQ(extractor.extract(file).text,
              "[SHEET: Dates]\n2024-01-15 00:00:00 | 2024-01-15 12:00:00\n45306 | 45306 | 18:00:00");
}

TEST(XlsxExtractorTest, MissingWorkbookYieldsEmptyText) {
    const TempDir dir;
    const auto file = dir.path() / "nobook.xlsx";
    write_zip(file, {{"xl/sharedStrings.xml", kSharedStrings}});

    const XlsxExtractor extractor;
    const auto result = extractor.extract(file);
    EXPECT_TRUE(result.text.empty());
    EXPECT_EQ(result.units, 0u);
}

TEST(OoxmlArchiveTest, KeepsOnlyFilteredEntries) {
    const TempDir dir;
    const auto file = dir.path() / "pkg.zip";
    write_zip(file, {{"a.xml", "<a/>"}, {"b.bin", "xyz"}});

    const auto archive = OoxmlArchive::open(file, [](const std::string_view name) {
        return name.ends_with(".xml");
    });

    EXPECT_EQ(archive.size(), 1u);
    ASSERT_TRUE(archive.entry("a.xml").has_value());
    EXPECT_EQ(*archive.entry("a.xml"), "<a/>");
    EXPECT_FALSE(archive.contains("b.bin"));
    EXPECT_THROW((void)OoxmlArchive::open(dir.path() / "missing.zip", [](std::string_view) { return true; }),
                 std::runtime_error);
}
