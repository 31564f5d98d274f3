#include "../libdocmill/include/docmill.hpp"
#include "../libdocmill/include/logger.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace docmill;
using namespace docmill::test;

namespace {

struct RecordingObserver : DocMillObserver {
    std::mutex mtx;
    std::vector<std::string> started;
    std::vector<std::string> finished;
    std::vector<std::string> errors;
    std::size_t logs = 0;

    void onFileStart(const std::filesystem::path& path) override {
        std::lock_guard lock(mtx);
        started.push_back(path.filename().string());
    }

    void onFileFinish(const std::filesystem::path& path, std::size_t, std::size_t) override {
        std::lock_guard lock(mtx);
        finished.push_back(path.filename().string());
    }

    void onFileError(const std::filesystem::path& path, const std::string&) override {
        std::lock_guard lock(mtx);
        errors.push_back(path.filename().string());
    }

    void onLog(int, const std::string&, const std::string&) override {
        std::lock_guard lock(mtx);
        ++logs;
    }
};

} // namespace

TEST(DocMillTest, ProcessesSingleFile) {
    const TempDir dir;
    const auto file = dir.write("memo.txt", "A short memo. Nothing else.");

    DocMill mill;
    const auto result = mill.process(file, DocumentType::General);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.text, "A short memo. Nothing else.");
    EXPECT_EQ(result.chunks.size(), 1u);
}

TEST(DocMillTest, BatchReportsToObserver) {
    const TempDir dir;
    std::string long_text;
    for (int i = 0; i < 30; ++i) long_text += "Line " + std::to_string(i) + " of a longer report. ";
    const std::vector<std::filesystem::path> inputs = {
        dir.write("one.txt", "First file."),
        dir.write("two.txt", long_text),
        dir.path() / "absent.txt",
    };

    RecordingObserver observer;
    DocMill mill;
    mill.maxChunkSize(200).chunkOverlap(40).threads(2);
    mill.setObserver(&observer);

    const auto results = mill.process(inputs, DocumentType::Technical);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_GT(results[1].chunks.size(), 1u);
    EXPECT_EQ(results[2].error_kind, ErrorKind::FileNotFound);

    std::ranges::sort(observer.finished);
    EXPECT_EQ(observer.started.size(), 3u);
    EXPECT_EQ(observer.finished, (std::vector<std::string>{"one.txt", "two.txt"}));
    EXPECT_EQ(observer.errors, (std::vector<std::string>{"absent.txt"}));
    EXPECT_GT(observer.logs, 0u);
}

TEST(DocMillTest, ObserverIsDetachedAfterRun) {
    const TempDir dir;
    const auto file = dir.write("x.txt", "Some text.");

    RecordingObserver observer;
    DocMill mill;
    mill.setObserver(&observer);
    (void)mill.process(file, DocumentType::General);

    const std::size_t logs_after_run = observer.logs;
    Logger::log(LogLevel::Error, "outside any run", "test");
    EXPECT_EQ(observer.logs, logs_after_run);
}

TEST(DocMillTest, InvalidChunkSettingsThrow) {
    const TempDir dir;
    const auto file = dir.write("x.txt", "Some text.");

    DocMill mill;
    mill.maxChunkSize(100).chunkOverlap(100);
    EXPECT_THROW((void)mill.process(file, DocumentType::General), std::invalid_argument);

    mill.chunkOverlap(10);
    EXPECT_TRUE(mill.process(file, DocumentType::General).success);
}

TEST(DocMillTest, ListsSupportedFormats) {
    DocMill mill;
    const auto formats = mill.supportedFormats();

    const auto has = [&](const std::string& ext) {
        return std::ranges::any_of(formats, [&](const FormatCapability& c) { return c.extension == ext; });
    };
    EXPECT_TRUE(has(".pdf"));
    EXPECT_TRUE(has(".txt"));
    EXPECT_TRUE(has(".docx"));
    EXPECT_TRUE(has(".xlsx"));
    EXPECT_TRUE(has(".doc"));
}

TEST(DocMillTest, StopWithoutRunIsHarmless) {
    DocMill mill;
    EXPECT_NO_THROW(mill.stop());
}
