#include "../../include/chunker.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

#include <stdexcept>

namespace docmill {

namespace {

constexpr bool is_terminator(const char c) noexcept {
    return c == '.' || c == '!' || c == '?';
}

// Greedy accumulation of units joined by a separator under a byte budget.
class Packer {
public:
    Packer(std::vector<std::string>& out, const std::size_t budget, const std::string_view sep)
        : out_(out), budget_(budget), sep_(sep) {}

    // Closes the open segment if `unit` would not fit beside it.
    void make_room(const std::string_view unit) {
        if (!cur_.empty() && cur_.size() + sep_.size() + unit.size() > budget_) {
            flush();
        }
    }

    void add(const std::string_view unit) {
        make_room(unit);
        if (!cur_.empty()) cur_ += sep_;
        cur_ += unit;
    }

    void emit(std::string segment) {
        flush();
        out_.push_back(std::move(segment));
    }

    void flush() {
        if (!cur_.empty()) {
            out_.push_back(std::move(cur_));
            cur_.clear();
        }
    }

private:
    std::vector<std::string>& out_;
    std::size_t budget_;
    std::string_view sep_;
    std::string cur_;
};

std::vector<std::string_view> split_paragraphs(std::string_view text) {
    std::vector<std::string_view> paragraphs;
    while (true) {
        const auto sep = text.find("\n\n");
        const auto p = trim(text.substr(0, sep));
        if (!p.empty()) paragraphs.push_back(p);
        if (sep == std::string_view::npos) break;
        text.remove_prefix(sep + 2);
    }
    return paragraphs;
}

} // namespace

void ChunkerOptions::validate() const {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("max_chunk_size must be positive");
    }
    if (chunk_overlap >= max_chunk_size) {
        throw std::invalid_argument("chunk_overlap must be smaller than max_chunk_size");
    }
}

std::string Chunk::text() const {
    if (overlap.empty()) {
        return content;
    }
    std::string out;
    out.reserve(kContextMarker.size() + overlap.size() + content.size() + 3);
    out += kContextMarker;
    out += '\n';
    out += overlap;
    out += "\n\n";
    out += content;
    return out;
}

Chunker::Chunker(ChunkerOptions options)
    : options_(options),
      header_(R"((?:ARTICLE|SECTION|CLAUSE)\s+[0-9A-Za-z_]+[:.])", std::regex::ECMAScript | std::regex::icase) {
    options_.validate();
}

std::vector<std::string_view> Chunker::split_sentences(std::string_view text) {
    std::vector<std::string_view> pieces;
    std::size_t start = 0;
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        if (is_terminator(text[i]) && is_space(text[i + 1])) {
            const auto piece = trim(text.substr(start, i + 1 - start));
            if (!piece.empty()) pieces.push_back(piece);
            start = i + 1;
        }
    }
    const auto last = trim(text.substr(start));
    if (!last.empty()) pieces.push_back(last);
    return pieces;
}

std::vector<std::string> Chunker::split_words(const std::string_view sentence) const {
    const std::size_t budget = options_.max_chunk_size;
    std::vector<std::string> out;
    Packer packer(out, budget, " ");

    std::size_t i = 0;
    while (i < sentence.size()) {
        while (i < sentence.size() && is_space(sentence[i])) ++i;
        std::size_t j = i;
        while (j < sentence.size() && !is_space(sentence[j])) ++j;
        std::string_view word = sentence.substr(i, j - i);
        i = j;
        if (word.empty()) continue;

        // a word longer than the budget is cut on character boundaries
        while (word.size() > budget) {
            std::size_t cut = utf8_boundary_backward(word, budget);
            if (cut == 0) cut = utf8_boundary_forward(word, 1);
            packer.emit(std::string(word.substr(0, cut)));
            word.remove_prefix(cut);
        }
        if (!word.empty()) packer.add(word);
    }
    packer.flush();
    return out;
}

std::vector<std::string> Chunker::split_paragraph(const std::string_view paragraph) const {
    const std::size_t budget = options_.max_chunk_size;
    std::vector<std::string> out;
    Packer packer(out, budget, " ");

    for (const auto sentence : split_sentences(paragraph)) {
        if (sentence.size() <= budget) {
            packer.add(sentence);
        } else if (is_terminator(sentence.back())) {
            // atomic: a complete sentence is never broken
            packer.emit(std::string(sentence));
        } else {
            packer.flush();
            for (auto& piece : split_words(sentence)) {
                packer.emit(std::move(piece));
            }
        }
    }
    packer.flush();
    return out;
}

std::vector<std::string> Chunker::split_general(const std::string_view text) const {
    const std::size_t budget = options_.max_chunk_size;
    std::vector<std::string> out;
    Packer packer(out, budget, "\n\n");

    for (const auto paragraph : split_paragraphs(text)) {
        if (paragraph.size() <= budget) {
            packer.add(paragraph);
            continue;
        }
        auto pieces = split_paragraph(paragraph);
        if (pieces.empty()) continue;
        // the tail of an oversized paragraph stays open for the next paragraph
        std::string tail = std::move(pieces.back());
        pieces.pop_back();
        for (auto& piece : pieces) {
            packer.emit(std::move(piece));
        }
        if (tail.size() <= budget) {
            packer.add(tail);
        } else {
            packer.emit(std::move(tail));
        }
    }
    packer.flush();
    return out;
}

std::vector<std::string> Chunker::split_structural(const std::string_view text) const {
    std::vector<std::size_t> starts;
    using It = std::string_view::const_iterator;
    for (std::regex_iterator<It> it(text.begin(), text.end(), header_), end; it != end; ++it) {
        starts.push_back(static_cast<std::size_t>(it->position(0)));
    }
    if (starts.size() < 2) {
        return {};
    }

    std::vector<std::string_view> units;
    if (const auto preamble = trim(text.substr(0, starts.front())); !preamble.empty()) {
        units.push_back(preamble);
    }
    for (std::size_t k = 0; k < starts.size(); ++k) {
        const std::size_t end = k + 1 < starts.size() ? starts[k + 1] : text.size();
        if (const auto unit = trim(text.substr(starts[k], end - starts[k])); !unit.empty()) {
            units.push_back(unit);
        }
    }

    const std::size_t budget = options_.max_chunk_size;
    std::vector<std::string> out;
    Packer packer(out, budget, "\n\n");
    for (const auto unit : units) {
        if (unit.size() <= budget) {
            packer.add(unit);
            continue;
        }
        for (auto& piece : split_general(unit)) {
            packer.emit(std::move(piece));
        }
    }
    packer.flush();
    return out;
}

std::vector<std::string> Chunker::segment(const std::string_view text, const DocumentType type) const {
    if (text.size() <= options_.max_chunk_size) {
        return {std::string(text)};
    }

    if (is_legal_type(type)) {
        try {
            auto sections = split_structural(text);
            if (!sections.empty()) {
                return sections;
            }
            Logger::log(LogLevel::Debug, "No section structure found, using paragraph chunking", "chunker");
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, std::string("Section scan failed, using paragraph chunking: ") + e.what(),
                        "chunker");
        }
    }
    return split_general(text);
}

std::string Chunker::overlap_excerpt(const std::string_view previous) const {
    if (options_.chunk_overlap == 0 || previous.empty()) {
        return {};
    }
    std::size_t start = previous.size() > options_.chunk_overlap ? previous.size() - options_.chunk_overlap : 0;
    // snap back so a multi-byte last character still yields a non-empty tail
    start = utf8_boundary_backward(previous, start);
    const std::string_view tail = previous.substr(start);

    const auto sentences = split_sentences(tail);
    if (sentences.size() > 2) {
        return std::string(sentences[sentences.size() - 2]) + " " + std::string(sentences.back());
    }
    if (sentences.size() == 2) {
        return std::string(sentences.back());
    }
    return std::string(trim(tail));
}

std::vector<Chunk> Chunker::chunk(const std::string_view text, const DocumentType type) const {
    auto segments = segment(text, type);

    std::vector<Chunk> chunks;
    chunks.reserve(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i) {
        Chunk c;
        c.index = i;
        if (i > 0) {
            c.overlap = overlap_excerpt(chunks.back().content);
        }
        c.content = std::move(segments[i]);
        chunks.push_back(std::move(c));
    }

    if (chunks.size() > 1) {
        Logger::log(LogLevel::Info, "Text chunked into " + std::to_string(chunks.size()) + " chunks (" +
                    std::string(document_type_to_string(type)) + ")", "chunker");
    }
    return chunks;
}

} // namespace docmill
