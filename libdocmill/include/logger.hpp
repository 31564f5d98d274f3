/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Library code logs exclusively through Logger::log. Which sinks receive
 * the messages is decided by the host (CLI, tests, DocMill observer).
 */

#ifndef DOCMILL_LOGGER_HPP
#define DOCMILL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docmill {

/**
 * @brief Static logging facade for docmill.
 *
 * Delegates log messages to all registered ILogSink implementations.
 * With no sink installed, messages are dropped.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     * @return Raw pointer identifying the sink, usable with remove_sink().
     */
    static ILogSink* add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove (and destroy) a previously added sink.
     * @param sink Pointer returned by add_sink().
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "docmill").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "docmill");

    /// @return Number of installed sinks.
    static std::size_t sink_count();

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace docmill

#endif // DOCMILL_LOGGER_HPP
