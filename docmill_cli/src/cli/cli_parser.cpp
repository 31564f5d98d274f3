#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <map>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, summary).");

    app.add_flag("--ocr", settings.enable_ocr,
                 "Run OCR on PDF pages with little or no native text.");

    app.add_flag("--print-chunks", settings.print_chunks,
                 "Print the chunks of every processed file to stdout.");

    app.add_flag("--list-formats", settings.list_formats,
                 "Print the supported formats and their availability, then exit.");

    // --- Processing options ---
    app.add_option("-t,--type", settings.document_type,
                   "Document type: contract, legal, general, financial, technical.")
        ->default_val(docmill::DocumentType::General)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, docmill::DocumentType>{
                {"contract", docmill::DocumentType::Contract},
                {"legal", docmill::DocumentType::Legal},
                {"general", docmill::DocumentType::General},
                {"financial", docmill::DocumentType::Financial},
                {"technical", docmill::DocumentType::Technical}
            }, CLI::ignore_case));

    app.add_option("--max-chunk-size", settings.max_chunk_size,
                   "Maximum chunk size in bytes.")
        ->default_val(settings.max_chunk_size)
        ->check(CLI::PositiveNumber);

    app.add_option("--chunk-overlap", settings.chunk_overlap,
                   "Context carried over from the previous chunk, in bytes (0 disables).")
        ->default_val(settings.chunk_overlap)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--ocr-lang", settings.ocr_language,
                   "Tesseract language code(s), e.g. 'eng' or 'eng+deu'.")
        ->default_val(settings.ocr_language);

    app.add_option("--tessdata", settings.tessdata_path,
                   "Directory containing tesseract traineddata files.")
        ->check(CLI::ExistingDirectory);

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for parallel processing.")
        ->default_val(settings.num_threads)
        ->check(CLI::PositiveNumber);

    // --- Output ---
    app.add_option("-o,--output", settings.output_path,
                   "Write one JSON result per input file into directory PATH.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to this file.");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files or directories.")
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.list_formats && settings.inputs.empty()) {
            throw CLI::RequiredError("inputs");
        }

        if (!settings.output_path.empty() && std::filesystem::exists(settings.output_path)
            && !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory.");
        }
    });
}
