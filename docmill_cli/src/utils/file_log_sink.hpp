#ifndef DOCMILL_FILE_LOG_SINK_HPP
#define DOCMILL_FILE_LOG_SINK_HPP

#include "../../../libdocmill/include/file_utils.hpp"
#include "../../../libdocmill/include/log_sink.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

// writes every message, timestamped, to a log file
class FileLogSink final : public docmill::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const docmill::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << docmill::now_iso8601() << " [" << docmill::to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // DOCMILL_FILE_LOG_SINK_HPP
