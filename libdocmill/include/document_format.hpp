/**
 * @file document_format.hpp
 * @brief Defines the document format and document type enumerations.
 *
 * DocumentFormat selects the extractor that handles a file; DocumentType is
 * the caller-supplied hint that drives metadata extraction and chunking.
 * Conversion helpers map between enums and strings; mime_to_extension maps
 * sniffed MIME types of extensionless files to a canonical extension.
 */

#ifndef DOCMILL_DOCUMENT_FORMAT_HPP
#define DOCMILL_DOCUMENT_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace docmill {

/**
 * @brief Extractor families known to docmill.
 */
enum class DocumentFormat {
    Pdf,
    Text,
    WordDoc,
    Spreadsheet,
    Image,
    Unknown
};

/**
 * @brief Caller-supplied document category.
 *
 * Contract and Legal enable legal entity extraction and section-aware chunking.
 */
enum class DocumentType {
    Contract,
    Legal,
    General,
    Financial,
    Technical
};

///< Canonical extension used when a sniffed MIME type stands in for a missing one.
inline const std::unordered_map<std::string, std::string> mime_to_extension = {
    { "application/pdf",  ".pdf" },
    { "text/plain",       ".txt" },
    { "application/vnd.openxmlformats-officedocument.wordprocessingml.document", ".docx" },
    { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",       ".xlsx" },
    { "image/png",        ".png" },
    { "image/jpeg",       ".jpg" },
    { "image/tiff",       ".tiff" },
};

[[nodiscard]] inline std::string_view format_to_string(const DocumentFormat fmt) noexcept {
    switch (fmt) {
        case DocumentFormat::Pdf:         return "pdf";
        case DocumentFormat::Text:        return "text";
        case DocumentFormat::WordDoc:     return "word";
        case DocumentFormat::Spreadsheet: return "spreadsheet";
        case DocumentFormat::Image:       return "image";
        case DocumentFormat::Unknown:     break;
    }
    return "unknown";
}

[[nodiscard]] inline std::string_view document_type_to_string(const DocumentType type) noexcept {
    switch (type) {
        case DocumentType::Contract:  return "contract";
        case DocumentType::Legal:     return "legal";
        case DocumentType::General:   return "general";
        case DocumentType::Financial: return "financial";
        case DocumentType::Technical: return "technical";
    }
    return "general";
}

/**
 * @brief Parse a document type name (case-insensitive).
 * @return std::nullopt for names outside the closed set.
 */
[[nodiscard]] inline std::optional<DocumentType> parse_document_type(std::string_view name) {
    std::string s(name);
    std::ranges::transform(s, s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (s == "contract")  return DocumentType::Contract;
    if (s == "legal")     return DocumentType::Legal;
    if (s == "general")   return DocumentType::General;
    if (s == "financial") return DocumentType::Financial;
    if (s == "technical") return DocumentType::Technical;
    return std::nullopt;
}

/// @return True for the types that get legal entity extraction and section-aware chunking.
[[nodiscard]] constexpr bool is_legal_type(const DocumentType type) noexcept {
    return type == DocumentType::Contract || type == DocumentType::Legal;
}

} // namespace docmill

#endif // DOCMILL_DOCUMENT_FORMAT_HPP
