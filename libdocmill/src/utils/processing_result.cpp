#include "../../include/processing_result.hpp"

namespace docmill {

std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::FileNotFound:      return "file_not_found";
        case ErrorKind::UnsupportedFormat: return "unsupported_format";
        case ErrorKind::DependencyMissing: return "dependency_missing";
        case ErrorKind::NoTextExtracted:   return "no_text_extracted";
        case ErrorKind::Cancelled:         return "cancelled";
        case ErrorKind::Unexpected:        return "unexpected";
    }
    return "unexpected";
}

std::vector<std::string> ProcessingResult::chunk_texts() const {
    std::vector<std::string> out;
    out.reserve(chunks.size());
    for (const auto& c : chunks) {
        out.push_back(c.text());
    }
    return out;
}

void to_json(nlohmann::json& j, const PdfInfo& info) {
    j = nlohmann::json{
        {"page_count", info.page_count},
        {"encrypted", info.encrypted},
    };
    if (!info.title.empty()) j["title"] = info.title;
    if (!info.author.empty()) j["author"] = info.author;
    if (!info.producer.empty()) j["producer"] = info.producer;
}

void to_json(nlohmann::json& j, const FileMetadata& meta) {
    j = nlohmann::json{
        {"filename", meta.filename},
        {"file_size", meta.file_size},
        {"file_size_mb", meta.file_size_mb},
        {"created_at", meta.created_at},
        {"modified_at", meta.modified_at},
        {"extension", meta.extension},
        {"mime_type", meta.mime_type},
    };
    if (meta.pdf) j["pdf"] = *meta.pdf;
}

void to_json(nlohmann::json& j, const DocumentMetadata& meta) {
    j = nlohmann::json{
        {"document_type", std::string(document_type_to_string(meta.document_type))},
        {"language", meta.language},
        {"extracted_entities", meta.extracted_entities},
        {"paragraph_count", meta.paragraph_count},
        {"sentence_count", meta.sentence_count},
        {"contains_tables", meta.contains_tables},
        {"contains_monetary_amounts", meta.contains_monetary_amounts},
    };
}

void to_json(nlohmann::json& j, const ProcessingStats& stats) {
    j = nlohmann::json{
        {"char_count", stats.char_count},
        {"word_count", stats.word_count},
        {"chunk_count", stats.chunk_count},
        {"chunking_applied", stats.chunking_applied},
        {"processed_at", stats.processed_at},
        {"extraction_units", stats.extraction_units},
        {"ocr_units", stats.ocr_units},
        {"extraction_method", stats.extraction_method},
        {"duration_ms", stats.duration_ms},
    };
}

void to_json(nlohmann::json& j, const ProcessingResult& result) {
    if (!result.success) {
        j = nlohmann::json{
            {"success", false},
            {"error", result.error},
            {"error_kind", std::string(error_kind_to_string(result.error_kind))},
            {"filename", result.filename},
        };
        if (!result.supported_formats.empty()) j["supported_formats"] = result.supported_formats;
        if (!result.install_hint.empty()) j["install_hint"] = result.install_hint;
        if (result.file_metadata) j["file_metadata"] = *result.file_metadata;
        return;
    }

    j = nlohmann::json{
        {"success", true},
        {"text", result.text},
        {"chunks", result.chunk_texts()},
        {"filename", result.filename},
        {"format", result.format},
        {"document_type", std::string(document_type_to_string(result.document_type))},
        {"document_hash", result.document_hash},
        {"processing_stats", result.processing_stats},
    };
    if (result.file_metadata) j["file_metadata"] = *result.file_metadata;
    if (result.document_metadata) j["document_metadata"] = *result.document_metadata;
}

std::string to_json_string(const ProcessingResult& result, const int indent) {
    return nlohmann::json(result).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace docmill
