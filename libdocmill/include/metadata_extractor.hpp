/**
 * @file metadata_extractor.hpp
 * @brief Legal entity extraction and generic text statistics.
 */

#ifndef DOCMILL_METADATA_EXTRACTOR_HPP
#define DOCMILL_METADATA_EXTRACTOR_HPP

#include "document_format.hpp"
#include <cstddef>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace docmill {

/**
 * @brief Descriptive facts about an extracted text.
 */
struct DocumentMetadata {
    DocumentType document_type = DocumentType::General;
    std::string language = "en";
    ///< Entity class (e.g. "contract_parties") to its first matches in order of appearance.
    ///< Classes without matches are absent.
    std::map<std::string, std::vector<std::string>> extracted_entities;
    std::size_t paragraph_count = 0;
    std::size_t sentence_count = 0;
    bool contains_tables = false;
    bool contains_monetary_amounts = false;
};

/**
 * @brief Computes DocumentMetadata for a text.
 *
 * @details For contract and legal documents five case-insensitive pattern
 * classes are applied: contract_parties, contract_dates, monetary_amounts,
 * legal_sections and addresses. Classes with a capture group report the
 * captured text, the others the whole match; at most kMaxEntitiesPerClass
 * matches are kept per class. Patterns are matched line by line.
 *
 * The compiled patterns are immutable after construction, so one instance
 * can serve concurrent pipelines.
 */
class MetadataExtractor {
public:
    static constexpr std::size_t kMaxEntitiesPerClass = 5;

    MetadataExtractor();

    /**
     * @brief Analyze `text`. Never throws on content; an empty text yields zero counts.
     */
    [[nodiscard]] DocumentMetadata analyze(std::string_view text, DocumentType type) const;

    /// @return Number of blank-line separated blocks that are non-empty after trimming.
    [[nodiscard]] static std::size_t count_paragraphs(std::string_view text) noexcept;

    /// @return Number of runs of consecutive sentence terminators (`.`, `!`, `?`).
    [[nodiscard]] static std::size_t count_sentences(std::string_view text) noexcept;

private:
    struct EntityPattern {
        std::string name;
        std::regex re;
        bool captures = false;  ///< Report group 1 instead of the whole match
    };

    std::vector<EntityPattern> legal_patterns_;
    std::regex monetary_;

    [[nodiscard]] std::vector<std::string> find_entities(std::string_view text, const EntityPattern& p) const;
};

} // namespace docmill

#endif // DOCMILL_METADATA_EXTRACTOR_HPP
