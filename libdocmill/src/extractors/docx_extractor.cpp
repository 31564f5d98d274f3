#include "../../include/docx_extractor.hpp"
#include "../../include/logger.hpp"
#include "../../include/ooxml_archive.hpp"
#include "../../include/text_utils.hpp"

#include <pugixml.hpp>
#include <stdexcept>
#include <vector>

namespace docmill {

namespace {

constexpr const char* kDocumentPart = "word/document.xml";

// Text of a paragraph: every run, hyperlink and field result in order.
void collect_run_text(const pugi::xml_node node, std::string& out) {
    for (const pugi::xml_node child : node.children()) {
        const std::string_view name = child.name();
        if (name == "w:t") {
            out += child.child_value();
        } else if (name == "w:tab") {
            out += '\t';
        } else if (name == "w:br" || name == "w:cr") {
            out += '\n';
        } else if (name == "w:delText" || name == "w:instrText") {
            // deleted revisions and field codes are not visible text
        } else {
            collect_run_text(child, out);
        }
    }
}

std::string paragraph_text(const pugi::xml_node p) {
    std::string text;
    collect_run_text(p, text);
    return text;
}

// Cell text is its paragraphs joined by newlines.
std::string cell_text(const pugi::xml_node tc) {
    std::string text;
    bool first = true;
    for (const pugi::xml_node p : tc.children("w:p")) {
        if (!first) text += '\n';
        first = false;
        text += paragraph_text(p);
    }
    return std::string(trim(text));
}

std::string render_table(const pugi::xml_node tbl) {
    std::vector<std::string> rows;
    for (const pugi::xml_node tr : tbl.children("w:tr")) {
        std::string row;
        for (const pugi::xml_node tc : tr.children("w:tc")) {
            const std::string cell = cell_text(tc);
            if (cell.empty()) continue;
            if (!row.empty()) row += " | ";
            row += cell;
        }
        if (!row.empty()) rows.push_back(std::move(row));
    }
    if (rows.empty()) return {};

    std::string out = "[TABLE]\n";
    for (const auto& r : rows) {
        out += r;
        out += '\n';
    }
    out += "[/TABLE]";
    return out;
}

// Walks block-level content (body, content controls) without entering tables.
void collect_blocks(const pugi::xml_node node, std::vector<std::string>& paragraphs,
                    std::vector<pugi::xml_node>& tables) {
    for (const pugi::xml_node child : node.children()) {
        const std::string_view name = child.name();
        if (name == "w:p") {
            std::string text = paragraph_text(child);
            if (!is_blank(text)) paragraphs.push_back(std::move(text));
        } else if (name == "w:tbl") {
            tables.push_back(child);
        } else if (name == "w:sdt" || name == "w:sdtContent" || name == "w:customXml") {
            collect_blocks(child, paragraphs, tables);
        }
    }
}

} // namespace

std::string DocxExtractor::render_document_xml(const std::string_view xml, std::size_t* units) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        throw std::runtime_error(std::string("Failed to parse document.xml: ") + parsed.description());
    }

    const pugi::xml_node body = doc.document_element().child("w:body");
    std::vector<std::string> parts;
    std::vector<pugi::xml_node> tables;
    collect_blocks(body, parts, tables);

    std::size_t emitted_tables = 0;
    for (const pugi::xml_node tbl : tables) {
        std::string rendered = render_table(tbl);
        if (rendered.empty()) continue;
        parts.push_back(std::move(rendered));
        ++emitted_tables;
    }
    if (units) *units = emitted_tables;

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += parts[i];
    }
    return out;
}

ExtractionResult DocxExtractor::extract(const std::filesystem::path& path) const noexcept {
    ExtractionResult result;
    result.method = "ooxml";
    try {
        const auto package = OoxmlArchive::open(path, [](const std::string_view name) {
            return name == kDocumentPart;
        });
        const auto xml = package.entry(kDocumentPart);
        if (!xml) {
            Logger::log(LogLevel::Error, "No " + std::string(kDocumentPart) + " in " + path.filename().string(),
                        "docx_extractor");
            return result;
        }
        result.text = std::string(trim(render_document_xml(*xml, &result.units)));
        Logger::log(LogLevel::Debug, path.filename().string() + ": " + std::to_string(result.units) + " tables",
                    "docx_extractor");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "DOCX extraction failed for " + path.string() + ": " + e.what(),
                    "docx_extractor");
        result.text.clear();
        result.units = 0;
    }
    return result;
}

} // namespace docmill
