/**
 * @file extractor_registry.hpp
 * @brief Defines the capability table and the registry owning all IExtractor instances.
 */

#ifndef DOCMILL_EXTRACTOR_REGISTRY_HPP
#define DOCMILL_EXTRACTOR_REGISTRY_HPP

#include "extractor.hpp"
#include "ocr_engine.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace docmill {

/**
 * @brief Extraction settings fixed when the registry is built.
 */
struct ExtractorOptions {
    bool enable_ocr = false;                  ///< OCR fallback for scanned PDF pages
    std::string ocr_language = "eng";         ///< Tesseract language code(s)
    std::filesystem::path ocr_data_path;      ///< tessdata directory; empty for tesseract's default
    int pdf_render_dpi = 300;                 ///< Resolution of page renders handed to OCR
    std::size_t min_native_chars = 50;        ///< Below this many native characters a PDF page is OCR'd
    unsigned ocr_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
};

/**
 * @brief One row of the capability table.
 */
struct FormatDescriptor {
    std::string extension;              ///< Lowercase, with the dot (e.g. ".pdf")
    DocumentFormat format = DocumentFormat::Unknown;
    bool ocr_capable = false;           ///< OCR can contribute text for this format
    bool requires_ocr = false;          ///< No native-text path; OCR is the only way in
    bool dependency_available = true;   ///< The backend for this format is usable in this build
    std::string install_hint;           ///< How to make the format available; empty when available
};

/**
 * @brief Capability report of one extension, for introspection and the CLI.
 */
struct FormatCapability {
    std::string extension;
    bool available = false;
    bool ocr_capable = false;
    bool ocr_enabled = false;           ///< ocr_capable and OCR is switched on and usable
    bool requires_ocr = false;
    std::string install_hint;
};

/**
 * @brief Capability table and owner of all extractors.
 *
 * @details The table is built once in the constructor: static facts about
 * each extension plus the availability of OCR, checked a single time through
 * the OCR engine. Lookups are pure functions of the table afterwards, so a
 * registry can be shared by concurrent pipelines.
 *
 * Dispatch from a FormatDescriptor to its extractor is a switch over
 * DocumentFormat.
 */
class ExtractorRegistry {
public:
    /**
     * @brief Builds the table with a TesseractOcrEngine configured from `options`.
     */
    explicit ExtractorRegistry(const ExtractorOptions& options = {});

    /**
     * @brief Builds the table with a caller-supplied OCR engine.
     * @param ocr_engine Engine to check and use; nullptr means no OCR in this build.
     */
    ExtractorRegistry(const ExtractorOptions& options, std::shared_ptr<const IOcrEngine> ocr_engine);

    ExtractorRegistry(const ExtractorRegistry&) = delete;
    ExtractorRegistry& operator=(const ExtractorRegistry&) = delete;

    /**
     * @brief Looks up the descriptor of a file name by its extension (case-insensitive).
     * @throws UnsupportedFormatError if the extension is not in the table.
     * @throws DependencyMissingError if the format's backend is unavailable.
     */
    [[nodiscard]] const FormatDescriptor& resolve(const std::filesystem::path& filename) const;

    /**
     * @brief Like resolve(), but sniffs the content of extensionless files with libmagic.
     *
     * Files that do have an extension are never sniffed.
     */
    [[nodiscard]] const FormatDescriptor& resolve_file(const std::filesystem::path& path) const;

    /// @return The extractor serving `format`.
    /// @throws std::invalid_argument for DocumentFormat::Unknown.
    [[nodiscard]] const IExtractor& extractor_for(DocumentFormat format) const;

    /// @return True if the extension is known and its backend is available.
    [[nodiscard]] bool is_supported(const std::filesystem::path& filename) const;

    /// @return True if the format has no native-text path (images).
    [[nodiscard]] bool requires_ocr(const std::filesystem::path& filename) const;

    [[nodiscard]] bool ocr_available() const noexcept { return ocr_available_; }
    [[nodiscard]] bool ocr_enabled() const noexcept { return ocr_enabled_; }

    /// @return Every extension in the table, sorted.
    [[nodiscard]] std::vector<std::string> supported_extensions() const;

    /// @return The capability report of every extension, sorted by extension.
    [[nodiscard]] std::vector<FormatCapability> supported_formats() const;

    [[nodiscard]] const std::vector<std::unique_ptr<IExtractor>>& all() const { return extractors_; }

private:
    ///< Capability table keyed by lowercase extension.
    std::map<std::string, FormatDescriptor> table_;
    ///< Owned instances of all registered extractors.
    std::vector<std::unique_ptr<IExtractor>> extractors_;
    bool ocr_available_ = false;
    bool ocr_enabled_ = false;

    void build_table(const ExtractorOptions& options);
    void log_available_formats() const;
};

} // namespace docmill

#endif // DOCMILL_EXTRACTOR_REGISTRY_HPP
