/**
 * @file image_extractor.hpp
 * @brief Defines the IExtractor implementation for raster images.
 */

#ifndef DOCMILL_IMAGE_EXTRACTOR_HPP
#define DOCMILL_IMAGE_EXTRACTOR_HPP

#include "extractor.hpp"
#include "ocr_engine.hpp"
#include <array>
#include <memory>
#include <string_view>
#include <span>

namespace docmill {

/**
 * @brief Extracts text from scanned images (PNG, JPEG, TIFF) with OCR.
 *
 * @details Images have no native text, so OCR is the only path. The engine
 * is shared with the registry, which only dispatches images when the engine
 * passed its self-check.
 */
class ImageExtractor final : public IExtractor {
public:
    explicit ImageExtractor(std::shared_ptr<const IOcrEngine> ocr) : ocr_(std::move(ocr)) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "Image";
    }

    [[nodiscard]] DocumentFormat get_format() const noexcept override {
        return DocumentFormat::Image;
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 3> kMimes = { "image/png", "image/jpeg", "image/tiff" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 5> kExts = { ".png", ".jpg", ".jpeg", ".tiff", ".tif" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] ExtractionResult extract(const std::filesystem::path& path) const noexcept override;

private:
    std::shared_ptr<const IOcrEngine> ocr_;
};

} // namespace docmill

#endif // DOCMILL_IMAGE_EXTRACTOR_HPP
