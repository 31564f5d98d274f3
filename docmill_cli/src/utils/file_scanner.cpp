#include "file_scanner.hpp"
#include "../../../libdocmill/include/logger.hpp"
#include "../../../libdocmill/include/text_utils.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;
using docmill::Logger;
using docmill::LogLevel;

static bool is_junk(const fs::path& p) {
    const auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    const auto lower = docmill::to_lower(name);
    return lower == ".ds_store" || lower == "desktop.ini" || lower == "thumbs.db";
}

namespace {
template <typename Iterator>
void collect_directory(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    Iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Cannot read directory " + dir.string() + ": " + ec.message(), "scanner");
        return;
    }
    for (const Iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory walk stopped in " + dir.string() + ": " + ec.message(), "scanner");
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && !is_junk(it->path())) {
            out.push_back(it->path());
        }
    }
}
} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs, const bool recursive) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            std::vector<fs::path> files;
            if (recursive) {
                collect_directory<fs::recursive_directory_iterator>(in, files);
            } else {
                collect_directory<fs::directory_iterator>(in, files);
            }
            std::ranges::sort(files);
            result.insert(result.end(), files.begin(), files.end());
        } else if (fs::is_regular_file(in, ec) && !is_junk(in)) {
            result.push_back(in);
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
