/**
 * @file processing_result.hpp
 * @brief The record produced by DocumentPipeline for every file, and its JSON form.
 */

#ifndef DOCMILL_PROCESSING_RESULT_HPP
#define DOCMILL_PROCESSING_RESULT_HPP

#include "chunker.hpp"
#include "document_format.hpp"
#include "metadata_extractor.hpp"
#include "pdf_info.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmill {

/**
 * @brief Failure classes of a processing run.
 */
enum class ErrorKind {
    None,
    FileNotFound,
    UnsupportedFormat,
    DependencyMissing,
    NoTextExtracted,
    Cancelled,        ///< Not processed because a stop was requested
    Unexpected
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind) noexcept;

/**
 * @brief File system facts about an input file.
 */
struct FileMetadata {
    std::string filename;
    std::uintmax_t file_size = 0;
    double file_size_mb = 0.0;      ///< Rounded to 2 decimals
    std::string created_at;         ///< ISO-8601 local time (status change time on POSIX)
    std::string modified_at;        ///< ISO-8601 local time
    std::string extension;          ///< Lowercase, with the dot
    std::string mime_type = "unknown";
    std::optional<PdfInfo> pdf;     ///< Present for readable PDFs
};

struct ProcessingStats {
    std::size_t char_count = 0;     ///< Unicode code points of the text
    std::size_t word_count = 0;     ///< Whitespace-delimited words
    std::size_t chunk_count = 0;
    bool chunking_applied = false;  ///< More than one chunk
    std::string processed_at;       ///< ISO-8601 local time
    std::size_t extraction_units = 0;
    std::size_t ocr_units = 0;
    std::string extraction_method;
    std::int64_t duration_ms = 0;
};

/**
 * @brief Outcome of processing one file.
 *
 * On failure only `success`, `error`, `error_kind`, `filename` and the
 * failure-specific fields (`supported_formats`, `install_hint`,
 * `file_metadata`) are meaningful.
 */
struct ProcessingResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    std::string filename;
    std::string text;
    std::vector<Chunk> chunks;
    std::string format;             ///< Lowercase extension that selected the extractor
    DocumentType document_type = DocumentType::General;
    std::string document_hash;
    std::optional<FileMetadata> file_metadata;
    std::optional<DocumentMetadata> document_metadata;
    ProcessingStats processing_stats;

    std::vector<std::string> supported_formats;  ///< Set for UnsupportedFormat
    std::string install_hint;                    ///< Set for DependencyMissing

    /// @return The rendered chunks as handed to the indexer.
    [[nodiscard]] std::vector<std::string> chunk_texts() const;
};

void to_json(nlohmann::json& j, const PdfInfo& info);
void to_json(nlohmann::json& j, const FileMetadata& meta);
void to_json(nlohmann::json& j, const DocumentMetadata& meta);
void to_json(nlohmann::json& j, const ProcessingStats& stats);
void to_json(nlohmann::json& j, const ProcessingResult& result);

/**
 * @brief Serializes a result as indented JSON text.
 *
 * Invalid UTF-8 in any string is written as U+FFFD instead of throwing.
 */
[[nodiscard]] std::string to_json_string(const ProcessingResult& result, int indent = 2);

} // namespace docmill

#endif // DOCMILL_PROCESSING_RESULT_HPP
