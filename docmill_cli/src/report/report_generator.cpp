#include "report_generator.hpp"
#include "../../../libdocmill/include/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::vector<ReportRow> make_report_rows(const std::vector<std::filesystem::path>& inputs,
                                        const std::vector<docmill::ProcessingResult>& results) {
    std::vector<ReportRow> rows;
    const std::size_t n = std::min(inputs.size(), results.size());
    rows.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto& r = results[i];
        ReportRow row;
        row.path = inputs[i];
        row.success = r.success;
        row.error_kind = std::string(docmill::error_kind_to_string(r.error_kind));
        row.error_msg = r.error;
        if (r.file_metadata) {
            row.mime = r.file_metadata->mime_type;
            row.size = r.file_metadata->file_size;
        }
        if (r.success) {
            row.method = r.processing_stats.extraction_method;
            row.char_count = r.processing_stats.char_count;
            row.word_count = r.processing_stats.word_count;
            row.chunk_count = r.processing_stats.chunk_count;
            row.ocr_units = r.processing_stats.ocr_units;
            row.seconds = static_cast<double>(r.processing_stats.duration_ms) / 1000.0;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void print_console_report(const std::vector<ReportRow>& rows,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_mime = 11;
    std::size_t max_size = 10;
    std::size_t max_chars = 7;
    std::size_t max_chunks = 8;
    std::size_t max_method = 8;
    std::size_t max_result = 8;
    for (const auto& r : rows) {
        max_mime   = std::max(max_mime, r.mime.size() + 1);
        max_size   = std::max(max_size, std::to_string(r.size / 1024).size() + 1);
        max_chars  = std::max(max_chars, std::to_string(r.char_count).size() + 1);
        max_chunks = std::max(max_chunks, std::to_string(r.chunk_count).size() + 1);
        max_method = std::max(max_method, r.method.size() + 1);
    }

    const std::size_t fixed_cols_width = max_mime + max_size + max_chars + max_chunks + max_method + max_result;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10
                                       ? term_width - fixed_cols_width
                                       : 10;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len > 4 ? max_len - 4 : 0) + "... ";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_mime))   << "MIME type"
              << std::setw(static_cast<int>(max_size))   << "Size(KB)"
              << std::setw(static_cast<int>(max_chars))  << "Chars"
              << std::setw(static_cast<int>(max_chunks)) << "Chunks"
              << std::setw(static_cast<int>(max_method)) << "Method"
              << "Result\n";

    std::size_t ok = 0;
    std::size_t total_chunks = 0;
    std::size_t total_chars = 0;
    for (const auto& r : rows) {
        const char* outcome = r.success ? "OK" : "FAIL";
        const char* color = r.success ? "\033[1;32m" : "\033[1;31m";
        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(static_cast<int>(max_mime))   << r.mime
                  << std::setw(static_cast<int>(max_size))   << (r.size / 1024)
                  << std::setw(static_cast<int>(max_chars))  << r.char_count
                  << std::setw(static_cast<int>(max_chunks)) << r.chunk_count
                  << std::setw(static_cast<int>(max_method)) << r.method
                  << (use_colors ? color : "") << outcome << (use_colors ? "\033[0m" : "")
                  << "\n";
        if (!r.success && !r.error_msg.empty()) {
            std::cerr << "    " << r.error_kind << ": " << r.error_msg << "\n";
        }
        if (r.success) {
            ++ok;
            total_chunks += r.chunk_count;
            total_chars += r.char_count;
        }
    }

    std::cerr << "\nProcessed: " << ok << "/" << rows.size() << " files, "
              << total_chars << " characters, " << total_chunks << " chunks\n";
    std::cerr << "Total time: " << fixed2(total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<ReportRow>& rows,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        docmill::Logger::log(docmill::LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "File,MIME,Size(KB),Result,ErrorKind,Method,Chars,Words,Chunks,OcrPages,Time(s),Error\n";

    for (const auto& r : rows) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << (r.size / 1024) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << csv_escape(r.error_kind) << ","
            << csv_escape(r.method) << ","
            << r.char_count << ","
            << r.word_count << ","
            << r.chunk_count << ","
            << r.ocr_units << ","
            << fixed2(r.seconds) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << fixed2(total_seconds) << " seconds\n";
    return static_cast<bool>(out);
}
