#ifndef DOCMILL_PDF_INFO_HPP
#define DOCMILL_PDF_INFO_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace docmill {

/**
 * @brief Document-level facts about a PDF, read with qpdf.
 */
struct PdfInfo {
    std::size_t page_count = 0;
    bool encrypted = false;
    std::string title;     ///< /Info /Title, empty if absent
    std::string author;    ///< /Info /Author, empty if absent
    std::string producer;  ///< /Info /Producer, empty if absent
};

/**
 * @brief Reads page count, encryption flag and the /Info dictionary of a PDF.
 *
 * qpdf warnings are forwarded to the Logger at debug level.
 *
 * @return std::nullopt if qpdf cannot open the file (damaged, or encrypted
 * with a non-empty user password).
 */
[[nodiscard]] std::optional<PdfInfo> read_pdf_info(const std::filesystem::path& path) noexcept;

} // namespace docmill

#endif // DOCMILL_PDF_INFO_HPP
