#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>

namespace docmill {

    std::optional<std::string> read_file_bytes(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::nullopt;
        }
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return std::nullopt;
        }
        return data;
    }

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        // use a common base dir inside temp
        const auto base_tmp = std::filesystem::temp_directory_path() /
            ("docmill-" + prefix);

        std::filesystem::create_directories(base_tmp);

        const std::string stem = input_path.stem().string();
        const std::string dir_name = prefix + "_" + stem + "_" + RandomUtils::random_suffix();
        auto dir = base_tmp / dir_name;

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::filesystem::filesystem_error("make_temp_dir_for", dir, ec);
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    ScopedTempDir::ScopedTempDir(const std::filesystem::path& input_path, const std::string& prefix,
                                 const std::string_view tag)
        : dir_(make_temp_dir_for(input_path, prefix)), tag_(tag) {}

    ScopedTempDir::~ScopedTempDir() {
        cleanup_temp_dir(dir_, tag_);
    }

    std::string format_local_time(const std::time_t t) {
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm) == 0) {
            return {};
        }
        return buf;
    }

    std::string format_file_time(const std::filesystem::file_time_type t) {
        const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            t - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
        return format_local_time(std::chrono::system_clock::to_time_t(sys));
    }

    std::string now_iso8601() {
        return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    }

} // namespace docmill
