#ifndef DOCMILL_EXTRACTOR_HPP
#define DOCMILL_EXTRACTOR_HPP

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "document_format.hpp"

/**
 * @namespace docmill
 * @brief The main namespace for the docmill library.
 *
 * @details This namespace encapsulates all core functionality of docmill,
 * including the abstract IExtractor interface, the concrete per-format
 * extractors, the OCR engine, metadata extraction, the chunker, the
 * DocumentPipeline orchestrator and the BatchExecutor.
 */
namespace docmill {

/**
 * @brief Text produced by an extractor for one file.
 *
 * Page, sheet and table markers are embedded in `text`.
 */
struct ExtractionResult {
    std::string text;           ///< Extracted UTF-8 text, trimmed
    std::size_t units = 0;      ///< Pages, sheets or tables seen by the extractor
    std::size_t ocr_units = 0;  ///< Units whose text came from OCR
    std::string method;         ///< Extraction method label (e.g. "poppler", "poppler+tesseract")
};

/**
 * @brief Interface for a format-specific text extractor.
 *
 * Each implementation targets one DocumentFormat and is self-descriptive about
 * the extensions and MIME types it reads.
 *
 * Implementations are stateless regarding the files being processed, so one
 * instance owned by the ExtractorRegistry may serve concurrent pipelines.
 * extract() never throws: internal failures are logged and reported as an
 * empty text.
 */
class IExtractor {
public:
    virtual ~IExtractor() = default;

    // --- self-description ---

    /// @return Human-readable name of the extractor (e.g. "PDF", "DOCX").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format family this extractor serves.
    [[nodiscard]] virtual DocumentFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "application/pdf").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".pdf").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_extensions() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Extract the textual content of a file.
     * @param path Path to an existing file of this extractor's format.
     * @return The extracted text; empty on failure.
     */
    [[nodiscard]] virtual ExtractionResult extract(const std::filesystem::path& path) const noexcept = 0;
};

} // namespace docmill

#endif // DOCMILL_EXTRACTOR_HPP
