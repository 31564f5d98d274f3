/**
 * @file ocr_engine.hpp
 * @brief OCR engine interface and its Tesseract implementation.
 */

#ifndef DOCMILL_OCR_ENGINE_HPP
#define DOCMILL_OCR_ENGINE_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docmill {

/**
 * @brief Raised by an OCR engine when an image cannot be recognized.
 */
class OcrError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Turns a raster image into text.
 *
 * Implementations must be safe to call from several threads at once.
 */
class IOcrEngine {
public:
    virtual ~IOcrEngine() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Checks whether the engine can run with its configuration.
     *
     * Called once by ExtractorRegistry at construction.
     */
    [[nodiscard]] virtual bool self_check() const noexcept = 0;

    /**
     * @brief Recognize the text of an image file.
     * @param image Path to a raster image (PNG, JPEG, TIFF).
     * @return The recognized UTF-8 text (may be empty).
     * @throws OcrError if the image cannot be loaded or the engine fails.
     */
    [[nodiscard]] virtual std::string recognize(const std::filesystem::path& image) const = 0;
};

/**
 * @brief Tesseract (LSTM) engine reading images through leptonica.
 *
 * @details A fresh tesseract::TessBaseAPI is created for every call, so the
 * engine keeps no per-image state and concurrent calls do not interfere.
 * Images are normalized to 32-bit RGB before recognition and laid out as a
 * single uniform block of text (PSM 6).
 */
class TesseractOcrEngine final : public IOcrEngine {
public:
    /**
     * @param language Tesseract language code(s), e.g. "eng" or "eng+ita".
     * @param data_path Directory containing the traineddata files; empty for
     * tesseract's default lookup (TESSDATA_PREFIX).
     */
    explicit TesseractOcrEngine(std::string language = "eng",
                                std::filesystem::path data_path = {});

    [[nodiscard]] std::string_view get_name() const noexcept override { return "tesseract"; }

    [[nodiscard]] bool self_check() const noexcept override;

    [[nodiscard]] std::string recognize(const std::filesystem::path& image) const override;

    [[nodiscard]] const std::string& language() const noexcept { return language_; }

private:
    std::string language_;
    std::filesystem::path data_path_;
};

} // namespace docmill

#endif // DOCMILL_OCR_ENGINE_HPP
