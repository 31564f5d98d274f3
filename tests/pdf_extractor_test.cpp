#include "../libdocmill/include/pdf_extractor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace docmill;
using docmill::test::FakeOcrEngine;

TEST(PdfExtractorTest, ShortNativeTextNeedsOcr) {
    EXPECT_TRUE(PdfExtractor::needs_ocr("", 50));
    EXPECT_TRUE(PdfExtractor::needs_ocr("   page 1   ", 50));
    EXPECT_FALSE(PdfExtractor::needs_ocr(std::string(50, 'x'), 50));
}

TEST(PdfExtractorTest, ScannedPageTakesLongerOcrText) {
    const FakeOcrEngine engine(std::string(500, 'o'));
    const std::string native = "0123456789";

    const auto page = PdfExtractor::choose_page_text(native, [&] { return engine.recognize("page.png"); }, 50);

    EXPECT_TRUE(page.from_ocr);
    EXPECT_EQ(page.text, std::string(500, 'o'));
    EXPECT_EQ(engine.calls.load(), 1);
}

TEST(PdfExtractorTest, ShorterOcrTextKeepsNativeText) {
    const auto page = PdfExtractor::choose_page_text("native words", [] { return std::string("ocr"); }, 50);

    EXPECT_FALSE(page.from_ocr);
    EXPECT_EQ(page.text, "native words");
}

TEST(PdfExtractorTest, OcrFailureKeepsNativeText) {
    const auto page = PdfExtractor::choose_page_text("abc", []() -> std::string {
        throw OcrError("cannot read image");
    }, 50);

    EXPECT_FALSE(page.from_ocr);
    EXPECT_EQ(page.text, "abc");
}

TEST(PdfExtractorTest, PagesWithEnoughTextSkipOcr) {
    const FakeOcrEngine engine(std::string(500, 'o'));
    const std::string native(80, 'n');

    const auto page = PdfExtractor::choose_page_text(native, [&] { return engine.recognize("page.png"); }, 50);

    EXPECT_FALSE(page.from_ocr);
    EXPECT_EQ(page.text, native);
    EXPECT_EQ(engine.calls.load(), 0);
}

TEST(PdfExtractorTest, DisabledOcrKeepsNativeText) {
    const auto page = PdfExtractor::choose_page_text("", {}, 50);

    EXPECT_FALSE(page.from_ocr);
    EXPECT_TRUE(page.text.empty());
}

TEST(PdfExtractorTest, PagesAreNumberedAndSeparated) {
    EXPECT_EQ(PdfExtractor::assemble_pages({"first page", "second page"}),
              "[Page 1]\nfirst page\n\n[Page 2]\nsecond page");
    EXPECT_EQ(PdfExtractor::assemble_pages({"", "only text"}), "[Page 1]\n\n\n[Page 2]\nonly text");
    EXPECT_EQ(PdfExtractor::assemble_pages({}), "");
}

TEST(PdfExtractorTest, UnreadableFileYieldsEmptyText) {
    const test::TempDir dir;
    const auto file = dir.write("fake.pdf", "not a pdf at all");

    const PdfExtractor extractor(std::make_shared<FakeOcrEngine>("ignored"));
    const auto result = extractor.extract(file);

    EXPECT_TRUE(result.text.empty());
    EXPECT_EQ(result.ocr_units, 0u);
    EXPECT_TRUE(extractor.ocr_enabled());
    EXPECT_FALSE(PdfExtractor().ocr_enabled());
}
