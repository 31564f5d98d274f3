#ifndef DOCMILL_REPORT_GENERATOR_HPP
#define DOCMILL_REPORT_GENERATOR_HPP

#include "../../../libdocmill/include/processing_result.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct ReportRow {
    std::filesystem::path path;
    std::string mime;               // detected mime
    std::uintmax_t size{};          // input size in bytes
    bool success{};                 // text was extracted and chunked
    std::string error_kind;         // "none" on success
    std::string method;             // extraction method
    std::size_t char_count{};
    std::size_t word_count{};
    std::size_t chunk_count{};
    std::size_t ocr_units{};
    double seconds{};               // processing time
    std::string error_msg;          // if !success, reason of failure
};

/**
 * @brief Pairs every input path with its result. Both vectors are in input order.
 */
std::vector<ReportRow> make_report_rows(const std::vector<std::filesystem::path>& inputs,
                                        const std::vector<docmill::ProcessingResult>& results);

void print_console_report(const std::vector<ReportRow>& rows,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes the rows as CSV.
 * @return False if the file could not be opened.
 */
bool export_csv_report(const std::vector<ReportRow>& rows,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif // DOCMILL_REPORT_GENERATOR_HPP
