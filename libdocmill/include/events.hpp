#ifndef DOCMILL_EVENTS_HPP
#define DOCMILL_EVENTS_HPP

#include <filesystem>
#include <string>
#include <chrono>
#include <cstddef>

namespace docmill {

/**
 * @brief Events published by BatchExecutor while it works through a file list.
 *
 * Plain data carriers used with EventBus.
 */

/**
 * @brief Emitted when a worker starts processing a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path;
};

/**
 * @brief Emitted when a file was processed successfully.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;
    std::size_t index = 0;                 ///< Position of the file in the input list
    std::size_t char_count = 0;            ///< Characters of extracted text
    std::size_t chunk_count = 0;           ///< Number of chunks produced
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when the pipeline returned a failure result for a file.
 */
struct FileProcessErrorEvent {
    std::filesystem::path path;
    std::size_t index = 0;
    std::string error_message;
};

/**
 * @brief Emitted when a file is not processed at all (stop requested).
 */
struct FileProcessSkippedEvent {
    std::filesystem::path path;
    std::size_t index = 0;
    std::string reason;
};

} // namespace docmill

#endif // DOCMILL_EVENTS_HPP
