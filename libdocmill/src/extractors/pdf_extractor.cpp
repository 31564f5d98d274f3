#include "../../include/pdf_extractor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include "../../include/thread_pool.hpp"

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>

#include <algorithm>
#include <future>
#include <optional>
#include <utility>

namespace docmill {

namespace {

const char* extractor_tag() {
    return "pdf_extractor";
}

std::string page_native_text(poppler::document& doc, const int index) {
    const std::unique_ptr<poppler::page> page(doc.create_page(index));
    if (!page) {
        Logger::log(LogLevel::Warning, "Cannot open page " + std::to_string(index + 1), extractor_tag());
        return {};
    }
    const poppler::byte_array utf8 = page->text().to_utf8();
    return std::string(utf8.begin(), utf8.end());
}

} // namespace

PdfExtractor::PdfExtractor(std::shared_ptr<const IOcrEngine> ocr, const int render_dpi,
                           const std::size_t min_native_chars, const unsigned ocr_threads)
    : ocr_(std::move(ocr)),
      render_dpi_(render_dpi > 0 ? render_dpi : 300),
      min_native_chars_(min_native_chars),
      ocr_threads_(ocr_threads > 0 ? ocr_threads : 1) {}

bool PdfExtractor::needs_ocr(const std::string_view native, const std::size_t min_native_chars) noexcept {
    return utf8_length(trim(native)) < min_native_chars;
}

PdfExtractor::PageText PdfExtractor::choose_page_text(std::string native,
                                                      const std::function<std::string()>& run_ocr,
                                                      const std::size_t min_native_chars) {
    if (!run_ocr || !needs_ocr(native, min_native_chars)) {
        return {std::move(native), false};
    }
    try {
        std::string ocr_text = run_ocr();
        if (utf8_length(trim(ocr_text)) > utf8_length(trim(native))) {
            return {std::move(ocr_text), true};
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("OCR failed: ") + e.what(), extractor_tag());
    }
    return {std::move(native), false};
}

std::string PdfExtractor::assemble_pages(const std::vector<std::string>& pages) {
    std::string out;
    for (size_t i = 0; i < pages.size(); ++i) {
        out += "[Page " + std::to_string(i + 1) + "]\n";
        out += pages[i];
        out += "\n\n";
    }
    return std::string(trim(out));
}

std::size_t PdfExtractor::apply_ocr(const std::filesystem::path& path, poppler::document& document,
                                    std::vector<std::string>& pages) const {
    std::vector<size_t> candidates;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (needs_ocr(pages[i], min_native_chars_)) {
            candidates.push_back(i);
        }
    }
    if (candidates.empty()) {
        return 0;
    }
    if (!poppler::page_renderer::can_render()) {
        Logger::log(LogLevel::Warning, "poppler was built without a rendering backend, OCR skipped",
                    extractor_tag());
        return 0;
    }

    const ScopedTempDir tmp(path, "pdf", extractor_tag());

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_rgb24);

    // one poppler document is not shared between threads: render here, recognize on the pool
    std::vector<std::pair<size_t, std::filesystem::path>> renders;
    for (const size_t i : candidates) {
        const std::unique_ptr<poppler::page> page(document.create_page(static_cast<int>(i)));
        if (!page) continue;
        const poppler::image img = renderer.render_page(page.get(), render_dpi_, render_dpi_);
        if (!img.is_valid()) {
            Logger::log(LogLevel::Warning, "Failed to render page " + std::to_string(i + 1), extractor_tag());
            continue;
        }
        auto png = tmp.path() / ("page_" + std::to_string(i + 1) + ".png");
        if (!img.save(png.string(), "png", render_dpi_)) {
            Logger::log(LogLevel::Warning, "Failed to write render of page " + std::to_string(i + 1),
                        extractor_tag());
            continue;
        }
        renders.emplace_back(i, std::move(png));
    }

    std::size_t ocr_pages = 0;
    {
        ThreadPool pool(std::min<unsigned>(ocr_threads_, static_cast<unsigned>(renders.size())));
        std::vector<std::pair<size_t, std::future<PageText>>> futures;
        futures.reserve(renders.size());
        for (const auto& [index, png] : renders) {
            futures.emplace_back(index, pool.enqueue(
                [this, native = pages[index], image = png](std::stop_token) {
                    return choose_page_text(native, [&] { return ocr_->recognize(image); }, min_native_chars_);
                }));
        }

        for (auto& [index, fut] : futures) {
            try {
                PageText chosen = fut.get();
                if (chosen.from_ocr) {
                    pages[index] = std::move(chosen.text);
                    ++ocr_pages;
                    Logger::log(LogLevel::Debug, "OCR applied to page " + std::to_string(index + 1),
                                extractor_tag());
                }
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Warning, "OCR failed for page " + std::to_string(index + 1) + ": " + e.what(),
                            extractor_tag());
            }
        }
    }
    return ocr_pages;
}

ExtractionResult PdfExtractor::extract(const std::filesystem::path& path) const noexcept {
    ExtractionResult result;
    result.method = "poppler";
    try {
        const std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path.string()));
        if (!doc) {
            Logger::log(LogLevel::Error, "Failed to open PDF: " + path.string(), extractor_tag());
            return result;
        }
        if (doc->is_locked()) {
            Logger::log(LogLevel::Warning, "PDF is password protected: " + path.string(), extractor_tag());
            return result;
        }

        const int page_count = doc->pages();
        std::vector<std::string> pages;
        pages.reserve(static_cast<size_t>(std::max(page_count, 0)));
        for (int i = 0; i < page_count; ++i) {
            pages.push_back(page_native_text(*doc, i));
        }

        if (ocr_) {
            result.ocr_units = apply_ocr(path, *doc, pages);
            if (result.ocr_units > 0) {
                result.method = "poppler+" + std::string(ocr_->get_name());
            }
        }

        const auto with_text = std::ranges::count_if(pages, [](const std::string& p) { return !is_blank(p); });
        Logger::log(LogLevel::Debug, "PDF processed: " + std::to_string(with_text) + " of " +
                    std::to_string(page_count) + " pages with text", extractor_tag());

        result.units = pages.size();
        result.text = assemble_pages(pages);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "PDF extraction failed for " + path.string() + ": " + e.what(), extractor_tag());
        result.text.clear();
        result.ocr_units = 0;
    }
    return result;
}

} // namespace docmill
