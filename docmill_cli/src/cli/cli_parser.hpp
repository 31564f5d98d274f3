#ifndef DOCMILL_CLI_PARSER_HPP
#define DOCMILL_CLI_PARSER_HPP

#include "../../../libdocmill/include/document_format.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool enable_ocr = false;
    bool print_chunks = false;
    bool list_formats = false;

    docmill::DocumentType document_type = docmill::DocumentType::General;
    std::size_t max_chunk_size = 4000;
    std::size_t chunk_overlap = 200;
    std::string ocr_language = "eng";
    std::filesystem::path tessdata_path;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // DOCMILL_CLI_PARSER_HPP
