/**
 * @file document_pipeline.hpp
 * @brief Defines the orchestrator turning one file into a ProcessingResult.
 */

#ifndef DOCMILL_DOCUMENT_PIPELINE_HPP
#define DOCMILL_DOCUMENT_PIPELINE_HPP

#include "chunker.hpp"
#include "extractor_registry.hpp"
#include "metadata_extractor.hpp"
#include "processing_result.hpp"
#include <filesystem>
#include <memory>

namespace docmill {

struct PipelineOptions {
    ExtractorOptions extraction;
    ChunkerOptions chunking;
};

/**
 * @brief Detect, extract, analyze, chunk and hash one document.
 *
 * @details Sequence: existence check, format resolution, file metadata,
 * text extraction, empty-text check, document metadata, chunking, content
 * hash. Every failure, foreseen or not, is returned as a ProcessingResult with
 * `success == false`; process() never throws.
 *
 * The pipeline holds only immutable state after construction, so process()
 * may be called concurrently for distinct files.
 */
class DocumentPipeline {
public:
    /**
     * @brief Builds a pipeline with its own ExtractorRegistry.
     * @throws std::invalid_argument for invalid chunking options.
     */
    explicit DocumentPipeline(const PipelineOptions& options = {});

    /**
     * @brief Builds a pipeline over an existing registry.
     * @throws std::invalid_argument for invalid chunking options or a null registry.
     */
    DocumentPipeline(std::shared_ptr<const ExtractorRegistry> registry, ChunkerOptions chunking);

    [[nodiscard]] ProcessingResult process(const std::filesystem::path& path, DocumentType type) const noexcept;

    [[nodiscard]] const ExtractorRegistry& registry() const noexcept { return *registry_; }
    [[nodiscard]] const Chunker& chunker() const noexcept { return chunker_; }

    /**
     * @brief File system facts of `path`: size, timestamps, extension, libmagic MIME type,
     * plus the qpdf document info for PDFs.
     * @throws std::filesystem::filesystem_error if the file cannot be stat'ed.
     */
    [[nodiscard]] static FileMetadata collect_file_metadata(const std::filesystem::path& path,
                                                            const FormatDescriptor& format);

private:
    std::shared_ptr<const ExtractorRegistry> registry_;
    Chunker chunker_;
    MetadataExtractor metadata_;
};

} // namespace docmill

#endif // DOCMILL_DOCUMENT_PIPELINE_HPP
