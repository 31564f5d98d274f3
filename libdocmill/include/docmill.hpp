/**
 * @file docmill.hpp
 * @brief Public API for the docmill library.
 */

#ifndef DOCMILL_HPP
#define DOCMILL_HPP

#include "document_format.hpp"
#include "extractor_registry.hpp"
#include "processing_result.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace docmill {

/**
 * @brief Interface for receiving progress and status events during execution.
 */
struct DocMillObserver {
    virtual ~DocMillObserver() = default;

    virtual void onFileStart(const std::filesystem::path& path) {}

    virtual void onFileFinish(const std::filesystem::path& path,
                              std::size_t char_count,
                              std::size_t chunk_count) {}

    virtual void onFileError(const std::filesystem::path& path,
                             const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the docmill library.
 *
 * @details Wraps the extraction and chunking pipeline into a simple, blocking
 * API. Uses PIMPL idiom to hide internal dependencies. Configuration changes
 * take effect on the next process() call; the extractor registry (and its
 * OCR self-check) is rebuilt only when extraction settings changed.
 */
class DocMill {
public:
    DocMill();
    ~DocMill();

    DocMill(const DocMill&) = delete;
    DocMill& operator=(const DocMill&) = delete;
    DocMill(DocMill&&) noexcept;
    DocMill& operator=(DocMill&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Segment budget in bytes.
     * Default: 4000.
     */
    DocMill& maxChunkSize(std::size_t val);

    /**
     * @brief Trailing window of the previous segment used as context; 0 disables.
     * Default: 200.
     */
    DocMill& chunkOverlap(std::size_t val);

    /**
     * @brief Enable OCR for scanned PDF pages.
     * Default: false.
     */
    DocMill& enableOcr(bool val);

    /**
     * @brief Tesseract language code(s).
     * Default: "eng".
     */
    DocMill& ocrLanguage(const std::string& lang);

    /**
     * @brief Directory holding tesseract traineddata files.
     * Default: empty (tesseract's own lookup).
     */
    DocMill& ocrDataPath(const std::filesystem::path& dir);

    /**
     * @brief Set the number of worker threads to use.
     * Default: hardware concurrency / 2.
     */
    DocMill& threads(unsigned val);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events and log messages.
     * The caller retains ownership of the observer.
     */
    void setObserver(DocMillObserver* observer);

    // --- Execution ---

    /**
     * @brief Processes one file. Blocks until completion.
     * @throws std::invalid_argument if the chunk settings are invalid.
     */
    ProcessingResult process(const std::filesystem::path& path, DocumentType type);

    /**
     * @brief Processes a list of files concurrently. Results follow input order.
     * @throws std::invalid_argument if the chunk settings are invalid.
     */
    std::vector<ProcessingResult> process(const std::vector<std::filesystem::path>& paths, DocumentType type);

    /**
     * @brief Capability report of every known extension under the current settings.
     */
    std::vector<FormatCapability> supportedFormats();

    // --- Control ---

    /**
     * @brief Requests cancellation. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docmill

#endif // DOCMILL_HPP
