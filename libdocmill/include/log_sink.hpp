#ifndef DOCMILL_LOG_SINK_HPP
#define DOCMILL_LOG_SINK_HPP

#include <optional>
#include <string_view>

namespace docmill {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< General informational messages about normal operation
    Warning, ///< Degraded results (e.g. OCR failed on a page, lossy decoding)
    Error    ///< A file could not be extracted or processed
};

/// @return Label written by the sinks: "DEBUG", "INFO", "WARN" or "ERROR".
[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/**
 * @brief Parses a level name, ignoring case. "WARN" and "WARNING" are both accepted.
 * @return std::nullopt for any other name (the CLI's "NONE" included).
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages go
 * (console, file, an observer of the DocMill facade). The Logger
 * facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component (e.g. "pdf_extractor").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace docmill

#endif // DOCMILL_LOG_SINK_HPP
