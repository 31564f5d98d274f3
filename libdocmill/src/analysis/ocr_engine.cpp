#include "../../include/ocr_engine.hpp"
#include "../../include/logger.hpp"

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

#include <memory>
#include <utility>

namespace docmill {

namespace {

struct PixDeleter {
    void operator()(Pix* p) const noexcept {
        if (p) pixDestroy(&p);
    }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

struct TessDeleter {
    void operator()(tesseract::TessBaseAPI* api) const noexcept {
        if (api) {
            api->End();
            delete api;
        }
    }
};
using TessPtr = std::unique_ptr<tesseract::TessBaseAPI, TessDeleter>;

TessPtr init_api(const std::string& language, const std::filesystem::path& data_path) {
    TessPtr api(new tesseract::TessBaseAPI());
    const std::string dp = data_path.string();
    if (api->Init(dp.empty() ? nullptr : dp.c_str(), language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        return nullptr;
    }
    return api;
}

// leptonica reads palette, gray and RGBA images alike; tesseract gets 32 bpp RGB
PixPtr load_rgb(const std::filesystem::path& image) {
    PixPtr src(pixRead(image.string().c_str()));
    if (!src) {
        return nullptr;
    }
    if (pixGetDepth(src.get()) == 32) {
        return src;
    }
    return PixPtr(pixConvertTo32(src.get()));
}

} // namespace

TesseractOcrEngine::TesseractOcrEngine(std::string language, std::filesystem::path data_path)
    : language_(std::move(language)), data_path_(std::move(data_path)) {}

bool TesseractOcrEngine::self_check() const noexcept {
    try {
        if (!init_api(language_, data_path_)) {
            Logger::log(LogLevel::Warning,
                        "Tesseract cannot initialize language '" + language_ + "'", "ocr_engine");
            return false;
        }
        Logger::log(LogLevel::Debug, std::string("Tesseract ") + tesseract::TessBaseAPI::Version() +
                    " ready (" + language_ + ")", "ocr_engine");
        return true;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Tesseract self-check failed: ") + e.what(), "ocr_engine");
        return false;
    }
}

std::string TesseractOcrEngine::recognize(const std::filesystem::path& image) const {
    auto api = init_api(language_, data_path_);
    if (!api) {
        throw OcrError("Tesseract init failed for language '" + language_ + "'");
    }

    const PixPtr pix = load_rgb(image);
    if (!pix) {
        throw OcrError("Cannot read image: " + image.string());
    }

    api->SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    api->SetImage(pix.get());

    const std::unique_ptr<char[]> out(api->GetUTF8Text());
    if (!out) {
        throw OcrError("Recognition failed: " + image.string());
    }
    return std::string(out.get());
}

} // namespace docmill
