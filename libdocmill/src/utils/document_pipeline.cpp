#include "../../include/document_pipeline.hpp"
#include "../../include/content_hash.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/text_utils.hpp"

#include <sys/stat.h>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace fs = std::filesystem;

namespace docmill {

namespace {

const char* pipeline_tag() {
    return "pipeline";
}

ProcessingResult failure(ProcessingResult r, const ErrorKind kind, std::string message) {
    r.success = false;
    r.error_kind = kind;
    r.error = std::move(message);
    return r;
}

} // namespace

DocumentPipeline::DocumentPipeline(const PipelineOptions& options)
    : DocumentPipeline(std::make_shared<const ExtractorRegistry>(options.extraction), options.chunking) {}

DocumentPipeline::DocumentPipeline(std::shared_ptr<const ExtractorRegistry> registry, const ChunkerOptions chunking)
    : registry_(std::move(registry)), chunker_(chunking) {
    if (!registry_) {
        throw std::invalid_argument("DocumentPipeline requires an extractor registry");
    }
}

FileMetadata DocumentPipeline::collect_file_metadata(const fs::path& path, const FormatDescriptor& format) {
    FileMetadata meta;
    meta.filename = sanitize_utf8(path.filename().string());
    meta.file_size = fs::file_size(path);
    meta.file_size_mb = std::round(static_cast<double>(meta.file_size) / (1024.0 * 1024.0) * 100.0) / 100.0;
    meta.modified_at = format_file_time(fs::last_write_time(path));

    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        meta.created_at = format_local_time(st.st_ctime);
    } else {
        meta.created_at = meta.modified_at;
    }

    meta.extension = to_lower(path.extension().string());
    if (meta.extension.empty()) {
        meta.extension = format.extension;
    }

    const std::string mime = MimeDetector::detect(path);
    meta.mime_type = mime.empty() ? "unknown" : mime;

    if (format.format == DocumentFormat::Pdf) {
        meta.pdf = read_pdf_info(path);
    }
    return meta;
}

ProcessingResult DocumentPipeline::process(const fs::path& path, const DocumentType type) const noexcept {
    const auto start = std::chrono::steady_clock::now();
    ProcessingResult result;

    try {
        // results are JSON-bound; non-UTF-8 names (e.g. Latin-1 on Linux) get U+FFFD
        result.filename = sanitize_utf8(path.filename().string());
        result.document_type = type;

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            Logger::log(LogLevel::Warning, "File not found: " + path.string(), pipeline_tag());
            return failure(std::move(result), ErrorKind::FileNotFound, "File not found");
        }

        const FormatDescriptor* format = nullptr;
        try {
            format = &registry_->resolve_file(path);
        } catch (const UnsupportedFormatError& e) {
            Logger::log(LogLevel::Warning, std::string(e.what()) + " (" + result.filename + ")", pipeline_tag());
            result.supported_formats = e.supported_formats();
            return failure(std::move(result), ErrorKind::UnsupportedFormat, e.what());
        } catch (const DependencyMissingError& e) {
            Logger::log(LogLevel::Warning, std::string(e.what()) + " (" + result.filename + ")", pipeline_tag());
            result.install_hint = e.install_hint();
            return failure(std::move(result), ErrorKind::DependencyMissing, e.what());
        }

        result.format = format->extension;
        result.file_metadata = collect_file_metadata(path, *format);

        const IExtractor& extractor = registry_->extractor_for(format->format);
        Logger::log(LogLevel::Debug, "Extracting " + result.filename + " with " + std::string(extractor.get_name()),
                    pipeline_tag());
        ExtractionResult extracted = extractor.extract(path);

        if (is_blank(extracted.text)) {
            Logger::log(LogLevel::Warning, "No text extracted from " + result.filename, pipeline_tag());
            return failure(std::move(result), ErrorKind::NoTextExtracted, "No text extracted from document");
        }

        result.text = sanitize_utf8(extracted.text);
        result.document_metadata = metadata_.analyze(result.text, type);
        result.chunks = chunker_.chunk(result.text, type);
        result.document_hash = document_hash(result.text);

        auto& stats = result.processing_stats;
        stats.char_count = utf8_length(result.text);
        stats.word_count = count_words(result.text);
        stats.chunk_count = result.chunks.size();
        stats.chunking_applied = result.chunks.size() > 1;
        stats.processed_at = now_iso8601();
        stats.extraction_units = extracted.units;
        stats.ocr_units = extracted.ocr_units;
        stats.extraction_method = std::move(extracted.method);
        stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        result.success = true;
        result.error_kind = ErrorKind::None;
        Logger::log(LogLevel::Info, "Document processed: " + result.filename + " (" +
                    std::to_string(result.chunks.size()) + " chunks)", pipeline_tag());
        return result;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Document processing failed for " + path.string() + ": " + e.what(),
                    pipeline_tag());
        result.text.clear();
        result.chunks.clear();
        result.document_metadata.reset();
        return failure(std::move(result), ErrorKind::Unexpected, e.what());
    }
}

} // namespace docmill
