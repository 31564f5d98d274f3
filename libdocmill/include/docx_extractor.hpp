/**
 * @file docx_extractor.hpp
 * @brief Defines the IExtractor implementation for word-processor documents.
 */

#ifndef DOCMILL_DOCX_EXTRACTOR_HPP
#define DOCMILL_DOCX_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <string>
#include <string_view>
#include <span>

namespace docmill {

/**
 * @brief Extracts body text and tables from WordprocessingML (.docx) files.
 *
 * @details The package is read with libarchive and `word/document.xml` is
 * parsed with pugixml. Output is the non-empty body paragraphs in document
 * order followed by every table rendered as
 * `[TABLE]\n<cell | cell>\n...\n[/TABLE]`, all parts separated by a blank
 * line. Paragraphs that live inside tables only appear in their table.
 *
 * Legacy binary .doc files share the WordDoc format but have no reader; the
 * ExtractorRegistry reports them as a missing dependency.
 */
class DocxExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "DOCX";
    }

    [[nodiscard]] DocumentFormat get_format() const noexcept override {
        return DocumentFormat::WordDoc;
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 1> kMimes = {
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document"
        };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".docx" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] ExtractionResult extract(const std::filesystem::path& path) const noexcept override;

    /**
     * @brief Renders the text of a `word/document.xml` part.
     * @param units Receives the number of tables emitted.
     * @throws std::runtime_error if the XML cannot be parsed.
     */
    [[nodiscard]] static std::string render_document_xml(std::string_view xml, std::size_t* units = nullptr);
};

} // namespace docmill

#endif // DOCMILL_DOCX_EXTRACTOR_HPP
