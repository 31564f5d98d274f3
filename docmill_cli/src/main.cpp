#include <atomic>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <CLI/CLI.hpp>

#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/progress_bar.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libdocmill/include/batch_executor.hpp"
#include "../../libdocmill/include/document_pipeline.hpp"
#include "../../libdocmill/include/event_bus.hpp"
#include "../../libdocmill/include/events.hpp"
#include "../../libdocmill/include/extractor_registry.hpp"
#include "../../libdocmill/include/logger.hpp"

using namespace docmill;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<BatchExecutor*> g_executor{nullptr};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        if (auto* executor = g_executor.load()) {
            executor->request_stop();
        }
    }
}

// file names are printed as-is; prefer a UTF-8 LC_CTYPE when the environment has none
static void init_utf8_locale() {
    const char* current = std::setlocale(LC_ALL, "");
    const std::string name = current ? current : "";
    if (name.find("UTF-8") != std::string::npos || name.find("utf8") != std::string::npos) {
        return;
    }
    for (const char* candidate : {"C.UTF-8", "en_US.UTF-8"}) {
        if (std::setlocale(LC_CTYPE, candidate)) {
            Logger::log(LogLevel::Debug, std::string("LC_CTYPE set to ") + candidate, "main");
            return;
        }
    }
    Logger::log(LogLevel::Warning, "No UTF-8 locale available, keeping " + (name.empty() ? "C" : name), "main");
}

static void print_formats(const ExtractorRegistry& registry) {
    std::cout << std::left << std::setw(10) << "Extension"
              << std::setw(11) << "Available"
              << std::setw(6) << "OCR"
              << "Notes\n";
    for (const auto& cap : registry.supported_formats()) {
        std::string notes;
        if (cap.requires_ocr) notes = "requires OCR";
        else if (cap.ocr_capable) notes = cap.ocr_enabled ? "OCR fallback enabled" : "OCR fallback disabled";
        if (!cap.available && !cap.install_hint.empty()) {
            notes += (notes.empty() ? "" : "; ") + cap.install_hint;
        }
        std::cout << std::setw(10) << cap.extension
                  << std::setw(11) << (cap.available ? "yes" : "no")
                  << std::setw(6) << (cap.ocr_capable ? "yes" : "no")
                  << notes << "\n";
    }
}

static void print_chunks(const ProcessingResult& result) {
    std::cout << "=== " << result.filename << " (" << result.chunks.size() << " chunks) ===\n";
    for (const auto& chunk : result.chunks) {
        std::cout << "--- chunk " << (chunk.index + 1) << "/" << result.chunks.size() << " ---\n"
                  << chunk.text() << "\n";
    }
}

static bool write_json_result(const ProcessingResult& result, const fs::path& input, const fs::path& output_dir) {
    const fs::path target = output_dir / (input.filename().string() + ".json");
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write " + target.string(), "main");
        return false;
    }
    out << to_json_string(result) << "\n";
    return static_cast<bool>(out);
}

int main(int argc, char* argv[]) {

    CLI::App app{"docmill: Extracts text from documents and splits it into retrieval-sized chunks."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 2;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (const auto level = parse_log_level(settings.log_level)) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : *level;
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    ExtractorOptions extraction;
    extraction.enable_ocr = settings.enable_ocr;
    extraction.ocr_language = settings.ocr_language;
    extraction.ocr_data_path = settings.tessdata_path;
    extraction.ocr_threads = settings.num_threads;

    ChunkerOptions chunking;
    chunking.max_chunk_size = settings.max_chunk_size;
    chunking.chunk_overlap = settings.chunk_overlap;

    std::shared_ptr<const ExtractorRegistry> registry;
    std::unique_ptr<DocumentPipeline> pipeline;
    try {
        chunking.validate();
        registry = std::make_shared<const ExtractorRegistry>(extraction);
        pipeline = std::make_unique<DocumentPipeline>(registry, chunking);
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return 2;
    }

    if (settings.list_formats) {
        print_formats(*registry);
        return 0;
    }

    if (!settings.output_path.empty()) {
        std::error_code ec;
        fs::create_directories(settings.output_path, ec);
        if (ec) {
            std::cerr << RED << "Cannot create output directory " << settings.output_path.string()
                      << ": " << ec.message() << RESET << std::endl;
            return 2;
        }
    }

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings.recursive);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    ProgressBar progress(inputs.size(), !settings.quiet);

    EventBus bus;
    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        progress.note("[DONE] " + e.path.filename().string() + " (" + std::to_string(e.char_count) +
                      " chars, " + std::to_string(e.chunk_count) + " chunks, " +
                      std::to_string(e.duration.count()) + " ms)", GREEN);
        progress.advance();
    });
    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        Logger::log(LogLevel::Error, e.path.filename().string() + ": " + e.error_message, "main");
        progress.advance();
    });
    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent&) {
        progress.advance();
    });

    std::vector<ProcessingResult> results;
    {
        BatchExecutor executor(*pipeline, bus, settings.num_threads);
        g_executor.store(&executor);
        results = executor.process(inputs, settings.document_type);
        g_executor.store(nullptr);
    }

    const double total_seconds = progress.elapsed_seconds();

    if (interrupted.load()) {
        std::cerr << CYAN << "\n[INTERRUPT] Stopped before all files were processed." << RESET << std::endl;
    }

    bool all_ok = true;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (!result.success) all_ok = false;

        if (!settings.output_path.empty() && result.error_kind != ErrorKind::Cancelled) {
            if (!write_json_result(result, inputs[i], settings.output_path)) all_ok = false;
        }
        if (settings.print_chunks && result.success) {
            print_chunks(result);
        }
    }

    const auto rows = make_report_rows(inputs, results);
    if (!settings.quiet) {
        print_console_report(rows, settings.num_threads, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(rows, settings.report_path, total_seconds)) all_ok = false;
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return all_ok ? 0 : 1;
}
