#ifndef DOCMILL_PROGRESS_BAR_HPP
#define DOCMILL_PROGRESS_BAR_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

#include "report_generator.hpp"
#include "../utils/color.hpp"

/**
 * @brief Single-line batch progress on stderr.
 *
 * Thread-safe: finished files are reported from worker threads through the
 * EventBus. A disabled bar only counts.
 */
class ProgressBar {
public:
    ProgressBar(const std::size_t total, const bool enabled)
        : total_(total), enabled_(enabled), start_(std::chrono::steady_clock::now()) {}

    /// Counts one finished file and redraws the bar.
    void advance() {
        std::lock_guard lock(mtx_);
        ++done_;
        draw();
    }

    /// Prints a full line above the bar, then redraws it.
    void note(const std::string& line, const char* color) {
        if (!enabled_) return;
        std::lock_guard lock(mtx_);
        std::cerr << "\r\033[K" << color << line << RESET << "\n";
        draw();
    }

    [[nodiscard]] double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    void draw() const {
        if (!enabled_ || total_ == 0) return;
        const unsigned width = std::clamp(get_terminal_width(), 50u, 200u) - 40u;
        const double fraction = static_cast<double>(done_) / static_cast<double>(total_);
        const auto filled = static_cast<unsigned>(fraction * width);

        std::cerr << "\r[" << std::string(filled, '#') << std::string(width - filled, '.') << "] "
                  << std::setw(3) << static_cast<unsigned>(fraction * 100.0) << "% "
                  << done_ << "/" << total_ << " "
                  << std::fixed << std::setprecision(1) << elapsed_seconds() << "s" << std::flush;
        if (done_ == total_) std::cerr << "\n";
    }

    std::size_t total_;
    std::size_t done_ = 0;
    bool enabled_;
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex mtx_;
};

#endif // DOCMILL_PROGRESS_BAR_HPP
