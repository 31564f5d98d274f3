#ifndef DOCMILL_TEST_HELPERS_HPP
#define DOCMILL_TEST_HELPERS_HPP

#include "../libdocmill/include/ocr_engine.hpp"
#include "../libdocmill/include/random_utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace docmill::test {

// unique directory under the system temp path, removed with the fixture
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("docmill_test_" + RandomUtils::random_suffix())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, std::string_view content) const {
        const auto p = path_ / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return p;
    }

private:
    std::filesystem::path path_;
};

// OCR engine returning a fixed text, without touching the image
class FakeOcrEngine final : public IOcrEngine {
public:
    explicit FakeOcrEngine(std::string text = {}, const bool usable = true)
        : text_(std::move(text)), usable_(usable) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "fake-ocr"; }

    [[nodiscard]] bool self_check() const noexcept override {
        ++self_checks;
        return usable_;
    }

    [[nodiscard]] std::string recognize(const std::filesystem::path&) const override {
        ++calls;
        if (!usable_) throw OcrError("engine unavailable");
        return text_;
    }

    mutable std::atomic<int> self_checks{0};
    mutable std::atomic<int> calls{0};

private:
    std::string text_;
    bool usable_;
};

// writes a ZIP package holding `entries` (name -> content) with libarchive
inline void write_zip(const std::filesystem::path& target, const std::map<std::string, std::string>& entries) {
    archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(archive_write_set_format_zip(a), ARCHIVE_OK);
    ASSERT_EQ(archive_write_open_filename(a, target.string().c_str()), ARCHIVE_OK);

    for (const auto& [name, content] : entries) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_entry_set_size(e, static_cast<la_int64_t>(content.size()));
        ASSERT_EQ(archive_write_header(a, e), ARCHIVE_OK);
        ASSERT_EQ(archive_write_data(a, content.data(), content.size()), static_cast<la_ssize_t>(content.size()));
        archive_entry_free(e);
    }

    ASSERT_EQ(archive_write_close(a), ARCHIVE_OK);
    archive_write_free(a);
}

inline constexpr const char* kWordNs =
    "xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"";

// wraps block-level WordprocessingML in a complete document part
inline std::string word_document(const std::string& body) {
    return std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                       "<w:document ") + kWordNs + "><w:body>" + body + "</w:body></w:document>";
}

inline std::string word_paragraph(const std::string& text) {
    return "<w:p><w:r><w:t xml:space=\"preserve\">" + text + "</w:t></w:r></w:p>";
}

} // namespace docmill::test

#endif // DOCMILL_TEST_HELPERS_HPP
