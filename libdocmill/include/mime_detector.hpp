#ifndef DOCMILL_MIME_DETECTOR_HPP
#define DOCMILL_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace docmill {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g., "application/pdf"), or an empty string
         * if libmagic cannot be initialized or the file cannot be read.
         *
         * @note Uses the system magic database.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace docmill

#endif // DOCMILL_MIME_DETECTOR_HPP
