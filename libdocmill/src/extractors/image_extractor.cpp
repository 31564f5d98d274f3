#include "../../include/image_extractor.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

namespace docmill {

ExtractionResult ImageExtractor::extract(const std::filesystem::path& path) const noexcept {
    ExtractionResult result;
    result.units = 1;
    if (!ocr_) {
        Logger::log(LogLevel::Error, "No OCR engine configured for " + path.filename().string(), "image_extractor");
        return result;
    }
    result.method = std::string(ocr_->get_name());
    try {
        result.text = std::string(trim(ocr_->recognize(path)));
        result.ocr_units = 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Image OCR failed for " + path.string() + ": " + e.what(), "image_extractor");
        result.text.clear();
    }
    return result;
}

} // namespace docmill
