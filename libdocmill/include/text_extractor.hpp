/**
 * @file text_extractor.hpp
 * @brief Defines the IExtractor implementation for plain text files.
 */

#ifndef DOCMILL_TEXT_EXTRACTOR_HPP
#define DOCMILL_TEXT_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <span>

namespace docmill {

/**
 * @brief Reads plain text files of unknown encoding.
 *
 * @details Decoding is attempted in order: UTF-8 (strict), Windows-1252
 * (strict, undefined bytes fail) and ISO-8859-1. The first decoding that
 * succeeds is converted to UTF-8 with iconv. If every attempt fails the bytes
 * are read as UTF-8 with invalid sequences replaced by U+FFFD and a warning
 * is logged. A leading byte order mark is dropped and the result is trimmed.
 */
class TextExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "Text";
    }

    [[nodiscard]] DocumentFormat get_format() const noexcept override {
        return DocumentFormat::Text;
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 1> kMimes = { "text/plain" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".txt" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] ExtractionResult extract(const std::filesystem::path& path) const noexcept override;

    /**
     * @brief Decodes raw bytes to trimmed UTF-8 text.
     * @param bytes File contents.
     * @param encoding_used Receives the name of the encoding that succeeded.
     */
    [[nodiscard]] static std::string decode(std::string_view bytes, std::string* encoding_used = nullptr);

    /**
     * @brief Strict conversion of `bytes` from `from_encoding` to UTF-8.
     * @return std::nullopt if the input holds a byte sequence invalid in that encoding.
     */
    [[nodiscard]] static std::optional<std::string> convert_to_utf8(std::string_view bytes,
                                                                    const char* from_encoding);
};

} // namespace docmill

#endif // DOCMILL_TEXT_EXTRACTOR_HPP
