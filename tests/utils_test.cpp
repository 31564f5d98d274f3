#include "../libdocmill/include/document_format.hpp"
#include "../libdocmill/include/event_bus.hpp"
#include "../libdocmill/include/events.hpp"
#include "../libdocmill/include/file_utils.hpp"
#include "../libdocmill/include/logger.hpp"
#include "../libdocmill/include/text_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace docmill;

TEST(TextUtilsTest, TrimAndBlank) {
    EXPECT_EQ(trim("  \t hello \r\n"), "hello");
    EXPECT_EQ(trim(""), "");
    EXPECT_TRUE(is_blank(" \n\t "));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(TextUtilsTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));   // euro sign
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));      // truncated
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));      // overlong
    EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
}

TEST(TextUtilsTest, CountsCodePointsAndWords) {
    EXPECT_EQ(utf8_length("d\xC3\xA9j\xC3\xA0"), 4u);
    EXPECT_EQ(count_words("  one two\tthree\n\nfour "), 4u);
    EXPECT_EQ(count_words(""), 0u);
    EXPECT_EQ(to_lower(".PDF"), ".pdf");
}

TEST(DocumentFormatTest, ParsesDocumentTypes) {
    EXPECT_EQ(parse_document_type("Contract"), DocumentType::Contract);
    EXPECT_EQ(parse_document_type("LEGAL"), DocumentType::Legal);
    EXPECT_FALSE(parse_document_type("poem").has_value());
    EXPECT_EQ(document_type_to_string(DocumentType::Financial), "financial");
    EXPECT_TRUE(is_legal_type(DocumentType::Contract));
    EXPECT_TRUE(is_legal_type(DocumentType::Legal));
    EXPECT_FALSE(is_legal_type(DocumentType::Technical));
}

TEST(FileUtilsTest, ScopedTempDirIsRemoved) {
    std::filesystem::path created;
    {
        const ScopedTempDir tmp("/some/where/report.pdf", "pdf", "test");
        created = tmp.path();
        ASSERT_TRUE(std::filesystem::is_directory(created));
        std::ofstream(created / "page_1.png") << "x";
    }
    EXPECT_FALSE(std::filesystem::exists(created));
}

TEST(FileUtilsTest, ReadsWholeFile) {
    const ScopedTempDir tmp("input.txt", "test", "test");
    const auto file = tmp.path() / "data.bin";
    std::ofstream(file, std::ios::binary) << std::string("a\0b", 3);

    const auto bytes = read_file_bytes(file);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, std::string("a\0b", 3));
    EXPECT_FALSE(read_file_bytes(tmp.path() / "missing").has_value());
}

TEST(EventBusTest, DeliversByTypeAndUnsubscribes) {
    EventBus bus;
    std::vector<std::string> seen;
    const auto first = bus.subscribe<FileProcessStartEvent>([&](const FileProcessStartEvent& e) {
        seen.push_back("a:" + e.path.string());
    });
    bus.subscribe<FileProcessStartEvent>([&](const FileProcessStartEvent& e) {
        seen.push_back("b:" + e.path.string());
    });
    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent&) { seen.emplace_back("skip"); });

    bus.publish(FileProcessStartEvent{"x.txt"});
    EXPECT_EQ(seen, (std::vector<std::string>{"a:x.txt", "b:x.txt"}));
    EXPECT_EQ(bus.subscriber_count<FileProcessStartEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<FileProcessErrorEvent>(), 0u);

    EXPECT_TRUE(bus.unsubscribe(first));
    EXPECT_FALSE(bus.unsubscribe(first));
    seen.clear();
    bus.publish(FileProcessStartEvent{"y.txt"});
    EXPECT_EQ(seen, (std::vector<std::string>{"b:y.txt"}));
}

namespace {
    struct CollectingSink final : ILogSink {
        std::vector<std::string>* lines;
        explicit CollectingSink(std::vector<std::string>* out) : lines(out) {}
        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            lines->push_back(std::string(to_string(level)) + "|" + std::string(tag) + "|" + std::string(message));
        }
    };
}

TEST(LoggerTest, FansOutToInstalledSinks) {
    std::vector<std::string> lines;
    const std::size_t before = Logger::sink_count();
    const ILogSink* sink = Logger::add_sink(std::make_unique<CollectingSink>(&lines));
    EXPECT_EQ(Logger::sink_count(), before + 1);

    Logger::log(LogLevel::Warning, "page 3 unreadable", "pdf_extractor");
    Logger::remove_sink(sink);
    Logger::log(LogLevel::Error, "not delivered");

    EXPECT_EQ(Logger::sink_count(), before);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "WARN|pdf_extractor|page 3 unreadable");
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("NONE").has_value());
    EXPECT_EQ(to_string(LogLevel::Info), "INFO");
}
