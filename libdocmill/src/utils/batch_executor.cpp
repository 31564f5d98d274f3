#include "../../include/batch_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

#include <chrono>
#include <future>
#include <utility>

namespace fs = std::filesystem;

namespace docmill {

BatchExecutor::BatchExecutor(const DocumentPipeline& pipeline, EventBus& bus, const unsigned threads)
    : pipeline_(pipeline), event_bus_(bus), pool_(threads) {}

ProcessingResult BatchExecutor::cancelled(const fs::path& path, const std::size_t index) const {
    event_bus_.publish(FileProcessSkippedEvent{path, index, "Interrupted"});
    ProcessingResult r;
    r.filename = path.filename().string();
    r.error_kind = ErrorKind::Cancelled;
    r.error = "Interrupted";
    return r;
}

std::vector<ProcessingResult> BatchExecutor::process(const std::vector<fs::path>& inputs, const DocumentType type) {
    std::vector<ProcessingResult> results(inputs.size());
    std::vector<std::future<ProcessingResult>> futures(inputs.size());

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (stop_flag_.load(std::memory_order_relaxed)) break;
        const fs::path file = inputs[i];
        try {
            futures[i] = pool_.enqueue([this, file, i, type](const std::stop_token& st) {
                if (st.stop_requested() || stop_flag_.load(std::memory_order_relaxed)) {
                    return cancelled(file, i);
                }
                event_bus_.publish(FileProcessStartEvent{file});

                const auto start = std::chrono::steady_clock::now();
                ProcessingResult r = pipeline_.process(file, type);
                const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);

                if (r.success) {
                    event_bus_.publish(FileProcessCompleteEvent{
                        file, i, r.processing_stats.char_count, r.chunks.size(), duration});
                } else {
                    event_bus_.publish(FileProcessErrorEvent{file, i, r.error});
                }
                return r;
            });
        } catch (const std::runtime_error& e) {
            // pool already stopped
            Logger::log(LogLevel::Debug, std::string("Not scheduled: ") + e.what(), "executor");
            break;
        }
    }

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (!futures[i].valid()) {
            results[i] = cancelled(inputs[i], i);
            continue;
        }
        try {
            results[i] = futures[i].get();
        } catch (const std::future_error&) {
            // task discarded by request_stop() before it started
            results[i] = cancelled(inputs[i], i);
        }
    }
    return results;
}

void BatchExecutor::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    pool_.request_stop();
    Logger::log(LogLevel::Info, "Stop requested", "executor");
}

} // namespace docmill
