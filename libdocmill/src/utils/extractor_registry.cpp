#include "../../include/extractor_registry.hpp"
#include "../../include/docx_extractor.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_extractor.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/pdf_extractor.hpp"
#include "../../include/text_extractor.hpp"
#include "../../include/text_utils.hpp"
#include "../../include/xlsx_extractor.hpp"

#include <algorithm>
#include <stdexcept>

namespace docmill {

namespace {

const char* registry_tag() {
    return "extractor_registry";
}

std::string lowercase_extension(const std::filesystem::path& filename) {
    return to_lower(filename.extension().string());
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

} // namespace

ExtractorRegistry::ExtractorRegistry(const ExtractorOptions& options)
    : ExtractorRegistry(options, std::make_shared<TesseractOcrEngine>(options.ocr_language, options.ocr_data_path)) {}

ExtractorRegistry::ExtractorRegistry(const ExtractorOptions& options, std::shared_ptr<const IOcrEngine> ocr_engine) {
    // the only runtime check: OCR usability is a configuration fact from here on
    ocr_available_ = ocr_engine && ocr_engine->self_check();
    ocr_enabled_ = options.enable_ocr && ocr_available_;
    if (options.enable_ocr && !ocr_available_) {
        Logger::log(LogLevel::Warning, "OCR requested but no usable OCR engine, scanned pages keep native text",
                    registry_tag());
    }

    const std::shared_ptr<const IOcrEngine> usable = ocr_available_ ? ocr_engine : nullptr;
    extractors_.push_back(std::make_unique<PdfExtractor>(ocr_enabled_ ? usable : nullptr,
                                                         options.pdf_render_dpi,
                                                         options.min_native_chars,
                                                         options.ocr_threads));
    extractors_.push_back(std::make_unique<TextExtractor>());
    extractors_.push_back(std::make_unique<DocxExtractor>());
    extractors_.push_back(std::make_unique<XlsxExtractor>());
    extractors_.push_back(std::make_unique<ImageExtractor>(usable));

    build_table(options);

    Logger::log(LogLevel::Info, std::string("Extractor registry ready - OCR: ") +
                (ocr_enabled_ ? "enabled" : "disabled"), registry_tag());
    log_available_formats();
}

void ExtractorRegistry::build_table(const ExtractorOptions& options) {
    // formats backed by a linked extractor take their extensions from it
    for (const auto& ex : extractors_) {
        for (const auto ext : ex->get_supported_extensions()) {
            FormatDescriptor d;
            d.extension = std::string(ext);
            d.format = ex->get_format();
            switch (d.format) {
                case DocumentFormat::Pdf:
                    d.ocr_capable = true;
                    break;
                case DocumentFormat::Image:
                    d.ocr_capable = true;
                    d.requires_ocr = true;
                    d.dependency_available = ocr_available_;
                    if (!ocr_available_) {
                        d.install_hint = "Install tesseract-ocr with the '" + options.ocr_language +
                                         "' language data (e.g. apt install tesseract-ocr tesseract-ocr-" +
                                         options.ocr_language + ") or point --tessdata at it";
                    }
                    break;
                default:
                    break;
            }
            table_.emplace(d.extension, std::move(d));
        }
    }

    // legacy binary office formats: known, routed to the OOXML families, no reader in this build
    FormatDescriptor doc{".doc", DocumentFormat::WordDoc, false, false, false,
                         "Convert the document to .docx (e.g. libreoffice --headless --convert-to docx)"};
    FormatDescriptor xls{".xls", DocumentFormat::Spreadsheet, false, false, false,
                         "Convert the workbook to .xlsx (e.g. libreoffice --headless --convert-to xlsx)"};
    table_.emplace(doc.extension, std::move(doc));
    table_.emplace(xls.extension, std::move(xls));
}

void ExtractorRegistry::log_available_formats() const {
    std::vector<std::string> available, ocr_formats, unavailable;
    for (const auto& [ext, d] : table_) {
        if (d.dependency_available) {
            available.push_back(ext);
            if (d.ocr_capable && ocr_enabled_) {
                ocr_formats.push_back(ext);
            }
        } else {
            unavailable.push_back(ext);
        }
    }
    Logger::log(LogLevel::Info, "Available formats: " + join(available), registry_tag());
    if (!ocr_formats.empty()) {
        Logger::log(LogLevel::Info, "OCR-enabled formats: " + join(ocr_formats), registry_tag());
    }
    if (!unavailable.empty()) {
        Logger::log(LogLevel::Debug, "Unavailable formats (missing deps): " + join(unavailable), registry_tag());
    }
}

const FormatDescriptor& ExtractorRegistry::resolve(const std::filesystem::path& filename) const {
    const std::string ext = lowercase_extension(filename);
    const auto it = table_.find(ext);
    if (it == table_.end()) {
        throw UnsupportedFormatError(ext, supported_extensions());
    }
    if (!it->second.dependency_available) {
        throw DependencyMissingError(ext, it->second.install_hint);
    }
    return it->second;
}

const FormatDescriptor& ExtractorRegistry::resolve_file(const std::filesystem::path& path) const {
    if (!path.extension().empty()) {
        return resolve(path);
    }

    const std::string mime = MimeDetector::detect(path);
    const auto it = mime_to_extension.find(mime);
    if (it == mime_to_extension.end()) {
        Logger::log(LogLevel::Debug, "No extension and unhandled MIME type '" + mime + "' for " + path.string(),
                    registry_tag());
        throw UnsupportedFormatError(mime.empty() ? std::string("(none)") : mime, supported_extensions());
    }
    Logger::log(LogLevel::Debug, path.filename().string() + " sniffed as " + mime, registry_tag());
    return resolve(std::filesystem::path("sniffed" + it->second));
}

const IExtractor& ExtractorRegistry::extractor_for(const DocumentFormat format) const {
    auto find = [this](const DocumentFormat f) -> const IExtractor& {
        for (const auto& ex : extractors_) {
            if (ex->get_format() == f) return *ex;
        }
        throw std::logic_error("No extractor registered for " + std::string(format_to_string(f)));
    };

    switch (format) {
        case DocumentFormat::Pdf:
        case DocumentFormat::Text:
        case DocumentFormat::WordDoc:
        case DocumentFormat::Spreadsheet:
        case DocumentFormat::Image:
            return find(format);
        case DocumentFormat::Unknown:
            break;
    }
    throw std::invalid_argument("No extractor for format " + std::string(format_to_string(format)));
}

bool ExtractorRegistry::is_supported(const std::filesystem::path& filename) const {
    const auto it = table_.find(lowercase_extension(filename));
    return it != table_.end() && it->second.dependency_available;
}

bool ExtractorRegistry::requires_ocr(const std::filesystem::path& filename) const {
    const auto it = table_.find(lowercase_extension(filename));
    return it != table_.end() && it->second.requires_ocr;
}

std::vector<std::string> ExtractorRegistry::supported_extensions() const {
    std::vector<std::string> exts;
    exts.reserve(table_.size());
    for (const auto& [ext, d] : table_) {
        exts.push_back(ext);
    }
    return exts;
}

std::vector<FormatCapability> ExtractorRegistry::supported_formats() const {
    std::vector<FormatCapability> caps;
    caps.reserve(table_.size());
    for (const auto& [ext, d] : table_) {
        FormatCapability c;
        c.extension = ext;
        c.available = d.dependency_available;
        c.ocr_capable = d.ocr_capable;
        c.ocr_enabled = d.ocr_capable && ocr_enabled_;
        c.requires_ocr = d.requires_ocr;
        c.install_hint = d.install_hint;
        caps.push_back(std::move(c));
    }
    return caps;
}

} // namespace docmill
