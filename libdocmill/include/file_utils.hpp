#ifndef DOCMILL_FILE_UTILS_HPP
#define DOCMILL_FILE_UTILS_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace docmill {

    /**
     * @brief Reads a whole file into a byte string.
     * @return The file contents, or std::nullopt if the file cannot be opened or read.
     */
    std::optional<std::string> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Creates a directory inside the system temp path using a
     * "docmill-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g., "pdf").
     * @return Filesystem path to the newly created temporary directory.
     * @throws std::filesystem::filesystem_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag (e.g., "pdf_extractor").
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief RAII owner of a directory created by make_temp_dir_for().
     *
     * The directory and everything in it is removed when the guard goes out
     * of scope, including during stack unwinding.
     */
    class ScopedTempDir {
    public:
        ScopedTempDir(const std::filesystem::path &input_path, const std::string &prefix,
                      std::string_view tag = "file_utils");
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return dir_; }

    private:
        std::filesystem::path dir_;
        std::string tag_;
    };

    /**
     * @brief Formats a POSIX timestamp as local ISO-8601 ("YYYY-MM-DDTHH:MM:SS").
     */
    std::string format_local_time(std::time_t t);

    /**
     * @brief Formats a file timestamp as local ISO-8601 ("YYYY-MM-DDTHH:MM:SS").
     */
    std::string format_file_time(std::filesystem::file_time_type t);

    /**
     * @brief Current local time as ISO-8601 ("YYYY-MM-DDTHH:MM:SS").
     */
    std::string now_iso8601();

} // namespace docmill

#endif // DOCMILL_FILE_UTILS_HPP
