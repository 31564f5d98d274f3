/**
 * @file batch_executor.hpp
 * @brief Runs a DocumentPipeline over many files on a thread pool.
 */

#ifndef DOCMILL_BATCH_EXECUTOR_HPP
#define DOCMILL_BATCH_EXECUTOR_HPP

#include "document_pipeline.hpp"
#include "event_bus.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

namespace docmill {

/**
 * @brief Processes a list of files concurrently and reports progress.
 *
 * @details Each file is one ThreadPool task calling DocumentPipeline::process.
 * Progress is published on the EventBus (FileProcessStartEvent,
 * FileProcessCompleteEvent, FileProcessErrorEvent, FileProcessSkippedEvent).
 * Results are returned in input order regardless of completion order.
 */
class BatchExecutor {
public:
    /**
     * @param pipeline Pipeline shared by all workers; must outlive the executor.
     * @param bus EventBus used to publish progress and results.
     * @param threads Number of worker threads to use.
     */
    BatchExecutor(const DocumentPipeline& pipeline,
                  EventBus& bus,
                  unsigned threads = std::thread::hardware_concurrency() / 2);

    /**
     * @brief Process `inputs` as documents of `type`. Blocks until all files are done.
     *
     * Files not started when a stop is requested get a result of kind
     * ErrorKind::Cancelled.
     */
    [[nodiscard]] std::vector<ProcessingResult> process(const std::vector<std::filesystem::path>& inputs,
                                                        DocumentType type);

    /**
     * @brief Checks if a stop has been requested.
     * @note This reads the atomic stop flag with relaxed memory order.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Request the executor and its thread pool to stop.
     *
     * This is thread-safe and can be called from signal handlers
     * or other threads. Files already being processed finish.
     */
    void request_stop();

private:
    const DocumentPipeline& pipeline_;      ///< Pipeline run for every file
    EventBus& event_bus_;                   ///< Bus for publishing events
    ThreadPool pool_;                       ///< Workers, one file per task
    std::atomic<bool> stop_flag_{false};    ///< Flag to signal interruption

    [[nodiscard]] ProcessingResult cancelled(const std::filesystem::path& path, std::size_t index) const;
};

} // namespace docmill

#endif // DOCMILL_BATCH_EXECUTOR_HPP
