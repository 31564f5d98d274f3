#ifndef DOCMILL_CONSOLE_LOG_SINK_HPP
#define DOCMILL_CONSOLE_LOG_SINK_HPP

#include "../../../libdocmill/include/log_sink.hpp"
#include <iostream>
#include <mutex>
#include <string>

// prints messages at or above log_level; debug/info go to stdout, the rest to stderr
class ConsoleLogSink final : public docmill::ILogSink {
public:
    docmill::LogLevel log_level = docmill::LogLevel::Error;

    void log(const docmill::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::string label(docmill::to_string(level));
        label.resize(5, ' ');
        std::ostream& os = level >= docmill::LogLevel::Warning ? std::cerr : std::cout;

        std::lock_guard lock(mtx_);
        os << "[" << label << "][" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // DOCMILL_CONSOLE_LOG_SINK_HPP
