#include "../../include/metadata_extractor.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

namespace docmill {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

constexpr std::string_view kTableMarker = "[TABLE]";

} // namespace

MetadataExtractor::MetadataExtractor()
    : monetary_(R"(\$[\d,]+\.?\d*|\d+\s*(?:dollars?|USD))", kFlags) {
    legal_patterns_.push_back({"contract_parties",
        std::regex(R"((?:PARTIES?|BETWEEN|LANDLORD|TENANT|BUYER|SELLER|CLIENT|CONTRACTOR):\s*([^\n]+))", kFlags),
        true});
    legal_patterns_.push_back({"contract_dates",
        std::regex(R"((?:DATE|DATED|EFFECTIVE|EXECUTION|COMMENCEMENT):\s*([^\n]+))", kFlags),
        true});
    legal_patterns_.push_back({"monetary_amounts", monetary_, false});
    legal_patterns_.push_back({"legal_sections",
        std::regex(R"((?:ARTICLE|SECTION|CLAUSE)\s+[\d\w]+[:.])", kFlags),
        false});
    legal_patterns_.push_back({"addresses",
        std::regex(R"(\d+\s+[A-Za-z\s]+(?:Street|St|Avenue|Ave|Road|Rd|Drive|Dr|Boulevard|Blvd)[^\n]*)", kFlags),
        false});
}

std::vector<std::string> MetadataExtractor::find_entities(const std::string_view text, const EntityPattern& p) const {
    // whole text, so a label may end one line and its value start the next
    std::vector<std::string> found;
    using It = std::string_view::const_iterator;
    for (std::regex_iterator<It> it(text.begin(), text.end(), p.re), end; it != end; ++it) {
        const auto& m = *it;
        found.push_back(p.captures && m.size() > 1 ? m[1].str() : m[0].str());
        if (found.size() >= kMaxEntitiesPerClass) break;
    }
    return found;
}

std::size_t MetadataExtractor::count_paragraphs(std::string_view text) noexcept {
    std::size_t count = 0;
    while (true) {
        const auto sep = text.find("\n\n");
        if (!is_blank(text.substr(0, sep))) ++count;
        if (sep == std::string_view::npos) break;
        text.remove_prefix(sep + 2);
    }
    return count;
}

std::size_t MetadataExtractor::count_sentences(const std::string_view text) noexcept {
    std::size_t count = 0;
    bool in_run = false;
    for (const char c : text) {
        const bool terminator = c == '.' || c == '!' || c == '?';
        if (terminator && !in_run) ++count;
        in_run = terminator;
    }
    return count;
}

DocumentMetadata MetadataExtractor::analyze(const std::string_view text, const DocumentType type) const {
    DocumentMetadata meta;
    meta.document_type = type;

    if (is_legal_type(type)) {
        try {
            for (const auto& p : legal_patterns_) {
                auto found = find_entities(text, p);
                if (!found.empty()) {
                    meta.extracted_entities.emplace(p.name, std::move(found));
                }
            }
        } catch (const std::regex_error& e) {
            // regex engine limits (complexity, stack) on pathological input
            Logger::log(LogLevel::Warning, std::string("Entity extraction stopped: ") + e.what(), "metadata");
        }
    }

    try {
        meta.contains_monetary_amounts = std::regex_search(text.begin(), text.end(), monetary_);
    } catch (const std::regex_error& e) {
        Logger::log(LogLevel::Warning, std::string("Monetary scan stopped: ") + e.what(), "metadata");
    }

    meta.paragraph_count = count_paragraphs(text);
    meta.sentence_count = count_sentences(text);
    meta.contains_tables = text.find(kTableMarker) != std::string_view::npos;
    return meta;
}

} // namespace docmill
