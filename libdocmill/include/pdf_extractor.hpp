/**
 * @file pdf_extractor.hpp
 * @brief Defines the IExtractor implementation for PDF files using poppler.
 */

#ifndef DOCMILL_PDF_EXTRACTOR_HPP
#define DOCMILL_PDF_EXTRACTOR_HPP

#include "extractor.hpp"
#include "ocr_engine.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <span>
#include <vector>

namespace poppler {
class document;
}

namespace docmill {

/**
 * @brief Extracts page text from PDF files, with OCR for scanned pages.
 *
 * @details Native text comes from poppler-cpp. When a page's trimmed native
 * text is shorter than `min_native_chars` and an OCR engine is configured,
 * the page is rendered (poppler::page_renderer) to a PNG in a scoped
 * temporary directory and recognized; the OCR text replaces the native text
 * only if it is strictly longer once trimmed.
 *
 * Rendering runs on the calling thread; recognition of several pages runs on
 * a ThreadPool and results are reassembled by page index. Every page
 * contributes `[Page N]\n<text>\n\n` and the final text is trimmed.
 *
 * Locked (password protected) or unreadable documents yield empty text.
 */
class PdfExtractor final : public IExtractor {
public:
    /**
     * @brief Text chosen for one page.
     */
    struct PageText {
        std::string text;
        bool from_ocr = false;
    };

    /**
     * @param ocr OCR engine, or nullptr to disable the scanned-page fallback.
     * @param render_dpi Resolution of the page renders handed to OCR.
     * @param min_native_chars Pages with fewer trimmed native characters are OCR candidates.
     * @param ocr_threads Upper bound on concurrent page recognitions.
     */
    explicit PdfExtractor(std::shared_ptr<const IOcrEngine> ocr = nullptr,
                          int render_dpi = 300,
                          std::size_t min_native_chars = 50,
                          unsigned ocr_threads = 1);

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "PDF";
    }

    [[nodiscard]] DocumentFormat get_format() const noexcept override {
        return DocumentFormat::Pdf;
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 1> kMimes = { "application/pdf" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".pdf" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] ExtractionResult extract(const std::filesystem::path& path) const noexcept override;

    [[nodiscard]] bool ocr_enabled() const noexcept { return static_cast<bool>(ocr_); }

    /// @return True if the page's native text is too short to be trusted.
    [[nodiscard]] static bool needs_ocr(std::string_view native, std::size_t min_native_chars) noexcept;

    /**
     * @brief Decides the text of one page.
     *
     * `run_ocr` is only invoked when needs_ocr() holds; an empty function
     * means OCR is disabled. Exceptions from `run_ocr` are logged and the
     * native text is kept.
     */
    [[nodiscard]] static PageText choose_page_text(std::string native,
                                                   const std::function<std::string()>& run_ocr,
                                                   std::size_t min_native_chars);

    /// @return `[Page N]\n<text>\n\n` for each page, trimmed as a whole.
    [[nodiscard]] static std::string assemble_pages(const std::vector<std::string>& pages);

private:
    std::shared_ptr<const IOcrEngine> ocr_;
    int render_dpi_;
    std::size_t min_native_chars_;
    unsigned ocr_threads_;

    /**
     * @brief Replaces the text of scanned pages with OCR output.
     * @return Number of pages whose text now comes from OCR.
     */
    std::size_t apply_ocr(const std::filesystem::path& path, poppler::document& document,
                          std::vector<std::string>& pages) const;
};

} // namespace docmill

#endif // DOCMILL_PDF_EXTRACTOR_HPP
