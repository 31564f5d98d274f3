/**
 * @file chunker.hpp
 * @brief Splits extracted text into bounded, context-threaded segments.
 */

#ifndef DOCMILL_CHUNKER_HPP
#define DOCMILL_CHUNKER_HPP

#include "document_format.hpp"
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace docmill {

/**
 * @brief Size settings of the chunker. Sizes are bytes of UTF-8 text.
 */
struct ChunkerOptions {
    std::size_t max_chunk_size = 4000;  ///< Budget of a segment's own content
    std::size_t chunk_overlap = 200;    ///< Trailing window of the previous segment used as context; 0 disables

    /// @throws std::invalid_argument unless max_chunk_size > 0 and chunk_overlap < max_chunk_size.
    void validate() const;
};

/**
 * @brief One segment handed to the indexer.
 */
struct Chunk {
    std::size_t index = 0;
    std::string overlap;  ///< Context excerpt of the previous segment; empty for index 0
    std::string content;  ///< The segment's own text

    static constexpr std::string_view kContextMarker = "[CONTEXT FROM PREVIOUS SECTION]";

    /// @return `content`, prefixed by the context marker and the overlap when there is one.
    [[nodiscard]] std::string text() const;
};

/**
 * @brief Deterministic segmentation of document text.
 *
 * @details
 * - A text that fits the budget is returned as one segment, unchanged.
 * - Contract and legal documents are split at ARTICLE/SECTION/CLAUSE headers;
 *   text before the first header is kept as a leading unit. With fewer than
 *   two headers the general strategy applies.
 * - The general strategy splits on blank lines. Units are greedily packed
 *   into segments; a paragraph over budget is packed by sentences, a sentence
 *   without terminator over budget by words, and a single word over budget is
 *   cut on a UTF-8 boundary. A terminated sentence over budget is emitted whole.
 * - Every segment after the first carries the last one or two sentences of the
 *   trailing `chunk_overlap` bytes of its predecessor as context.
 */
class Chunker {
public:
    /// @throws std::invalid_argument for invalid options.
    explicit Chunker(ChunkerOptions options = {});

    [[nodiscard]] std::vector<Chunk> chunk(std::string_view text, DocumentType type) const;

    /// @return The segments' own contents, before overlap threading.
    [[nodiscard]] std::vector<std::string> segment(std::string_view text, DocumentType type) const;

    /// @return The context excerpt taken from a previous segment.
    [[nodiscard]] std::string overlap_excerpt(std::string_view previous) const;

    [[nodiscard]] const ChunkerOptions& options() const noexcept { return options_; }

    /// @return Sentence pieces of `text`: split after `.`/`!`/`?` followed by whitespace, trimmed.
    [[nodiscard]] static std::vector<std::string_view> split_sentences(std::string_view text);

private:
    ChunkerOptions options_;
    std::regex header_;

    [[nodiscard]] std::vector<std::string> split_structural(std::string_view text) const;
    [[nodiscard]] std::vector<std::string> split_general(std::string_view text) const;
    [[nodiscard]] std::vector<std::string> split_paragraph(std::string_view paragraph) const;
    [[nodiscard]] std::vector<std::string> split_words(std::string_view sentence) const;
};

} // namespace docmill

#endif // DOCMILL_CHUNKER_HPP
