#include "../libdocmill/include/chunker.hpp"
#include "../libdocmill/include/text_utils.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace docmill;

namespace {

std::vector<std::string> words_of(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    for (std::string w; in >> w;) words.push_back(w);
    return words;
}

// paragraphs of short sentences, well above the default budget
std::string long_document(const int paragraphs) {
    std::string text;
    for (int p = 0; p < paragraphs; ++p) {
        if (p > 0) text += "\n\n";
        for (int s = 0; s < 12; ++s) {
            if (s > 0) text += ' ';
            text += "Paragraph " + std::to_string(p) + " sentence " + std::to_string(s) +
                    " describes the obligations of both parties in plain words.";
        }
    }
    return text;
}

} // namespace

TEST(ChunkerTest, ShortTextIsReturnedUnchanged) {
    const Chunker chunker;
    const std::string text = "Hello world.\n\nSecond paragraph.";

    const auto chunks = chunker.chunk(text, DocumentType::General);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].content, text);
    EXPECT_TRUE(chunks[0].overlap.empty());
    EXPECT_EQ(chunks[0].text(), text);
}

TEST(ChunkerTest, TextOfExactlyTheBudgetIsOneChunk) {
    const Chunker chunker;
    const std::string text(4000, 'a');

    EXPECT_EQ(chunker.chunk(text, DocumentType::General).size(), 1u);
}

TEST(ChunkerTest, UnterminatedTextOverBudgetIsSplit) {
    const Chunker chunker;
    const std::string text(4001, 'a');

    const auto chunks = chunker.chunk(text, DocumentType::General);

    ASSERT_GE(chunks.size(), 2u);
    for (const auto& c : chunks) {
        EXPECT_LE(c.content.size(), 4000u);
    }
}

TEST(ChunkerTest, SegmentsRespectTheBudget) {
    const Chunker chunker({500, 100});
    const std::string text = long_document(10);

    const auto chunks = chunker.chunk(text, DocumentType::General);

    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_LE(c.content.size(), 500u) << "chunk " << c.index;
        EXPECT_FALSE(c.content.empty());
    }
}

TEST(ChunkerTest, SegmentsPreserveEveryWordInOrder) {
    const Chunker chunker({300, 50});
    const std::string text = long_document(6);

    std::string joined;
    for (const auto& segment : chunker.segment(text, DocumentType::General)) {
        joined += segment;
        joined += ' ';
    }

    EXPECT_EQ(words_of(joined), words_of(text));
}

TEST(ChunkerTest, ChunkingIsDeterministic) {
    const Chunker chunker({400, 80});
    const std::string text = long_document(8);

    const auto first = chunker.chunk(text, DocumentType::Contract);
    const auto second = chunker.chunk(text, DocumentType::Contract);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].index, i);
        EXPECT_EQ(first[i].content, second[i].content);
        EXPECT_EQ(first[i].overlap, second[i].overlap);
    }
}

TEST(ChunkerTest, FollowingChunksCarryContextFromPredecessor) {
    const Chunker chunker({500, 100});
    const auto chunks = chunker.chunk(long_document(10), DocumentType::General);

    ASSERT_GT(chunks.size(), 1u);
    EXPECT_TRUE(chunks[0].overlap.empty());
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_FALSE(chunks[i].overlap.empty());
        EXPECT_NE(chunks[i - 1].content.find(chunks[i].overlap), std::string::npos);

        const std::string rendered = chunks[i].text();
        EXPECT_TRUE(rendered.starts_with(Chunk::kContextMarker));
        EXPECT_TRUE(rendered.ends_with(chunks[i].content));
    }
}

TEST(ChunkerTest, ZeroOverlapDisablesContext) {
    const Chunker chunker({500, 0});
    const auto chunks = chunker.chunk(long_document(10), DocumentType::General);

    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_TRUE(c.overlap.empty());
        EXPECT_EQ(c.text(), c.content);
    }
}

TEST(ChunkerTest, OverlapExcerptKeepsLastTwoSentences) {
    const Chunker chunker({200, 60});

    EXPECT_EQ(chunker.overlap_excerpt("First sentence here. Second one is here. Third is last."),
              "Second one is here. Third is last.");
    EXPECT_EQ(chunker.overlap_excerpt("no terminator at all"), "no terminator at all");
    EXPECT_EQ(chunker.overlap_excerpt(""), "");
}

TEST(ChunkerTest, TinyOverlapKeepsWholeTrailingCharacter) {
    const Chunker chunker({10, 1});
    const auto chunks = chunker.chunk("abcdefgh\xC3\xA9\n\nsecond paragraph here", DocumentType::General);

    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, "abcdefgh\xC3\xA9");
    EXPECT_EQ(chunks[1].overlap, "\xC3\xA9");
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_FALSE(chunks[i].overlap.empty());
        EXPECT_TRUE(chunks[i].text().starts_with(Chunk::kContextMarker));
    }
    EXPECT_EQ(chunker.overlap_excerpt("x\xE2\x82\xAC"), "\xE2\x82\xAC");
}

TEST(ChunkerTest, ContractSectionsBecomeSeparateChunks) {
    const Chunker chunker({100, 20});
    const std::string s1 = "SECTION 1. The tenant shall pay rent on the first day of each month without fail.";
    const std::string s2 = "SECTION 2. The landlord shall maintain the premises in good repair at all times.";
    const std::string text = s1 + "\n\n" + s2;
    ASSERT_GT(text.size(), 100u);
    ASSERT_LE(s1.size(), 100u);
    ASSERT_LE(s2.size(), 100u);

    const auto segments = chunker.segment(text, DocumentType::Contract);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0], s1);
    EXPECT_EQ(segments[1], s2);
    for (const auto& s : segments) {
        EXPECT_TRUE(s.starts_with("SECTION"));
    }
}

TEST(ChunkerTest, PreambleBeforeFirstHeaderIsKept) {
    const Chunker chunker({120, 20});
    const std::string preamble = "This agreement is made between the parties named below.";
    const std::string a1 = "ARTICLE 1: Definitions used throughout this agreement are listed here.";
    const std::string a2 = "ARTICLE 2: The term of the agreement is twelve months from signing.";
    const std::string text = preamble + "\n" + a1 + "\n" + a2;

    const auto segments = chunker.segment(text, DocumentType::Legal);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], preamble);
    EXPECT_EQ(segments[1], a1);
    EXPECT_EQ(segments[2], a2);
}

TEST(ChunkerTest, ContractWithoutHeadersFallsBackToParagraphs) {
    const Chunker chunker({300, 50});
    const std::string text = long_document(5);

    EXPECT_EQ(chunker.segment(text, DocumentType::Contract), chunker.segment(text, DocumentType::General));
}

TEST(ChunkerTest, SingleHeaderFallsBackToParagraphs) {
    const Chunker chunker({300, 50});
    const std::string text = "SECTION 1. Scope.\n\n" + long_document(4);

    EXPECT_EQ(chunker.segment(text, DocumentType::Legal), chunker.segment(text, DocumentType::General));
}

TEST(ChunkerTest, HeadersAreIgnoredForGeneralDocuments) {
    const Chunker chunker({100, 20});
    const std::string text = "SECTION 1. Short.\n\nSECTION 2. Also short.\n\nSome closing words for everybody.\n\n"
                             "More words to push the text over the budget of one hundred bytes.";

    const auto segments = chunker.segment(text, DocumentType::General);

    ASSERT_FALSE(segments.empty());
    EXPECT_TRUE(segments[0].starts_with("SECTION 1. Short.\n\nSECTION 2. Also short."));
}

TEST(ChunkerTest, OversizedSentenceIsKeptWhole) {
    const Chunker chunker({50, 10});
    const std::string big = "This single sentence is deliberately longer than the fifty byte budget.";
    ASSERT_GT(big.size(), 50u);
    const std::string text = "Short one.\n\n" + big + "\n\nTail here.";

    const auto segments = chunker.segment(text, DocumentType::General);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], "Short one.");
    EXPECT_EQ(segments[1], big);
    EXPECT_EQ(segments[2], "Tail here.");
}

TEST(ChunkerTest, LongWordIsCutOnCharacterBoundaries) {
    const Chunker chunker({25, 5});
    std::string word;
    for (int i = 0; i < 30; ++i) word += "\xC3\xA9"; // e with acute accent, 2 bytes

    const auto segments = chunker.segment(word, DocumentType::General);

    ASSERT_GE(segments.size(), 3u);
    std::string joined;
    for (const auto& s : segments) {
        EXPECT_LE(s.size(), 25u);
        EXPECT_TRUE(is_valid_utf8(s));
        joined += s;
    }
    EXPECT_EQ(joined, word);
}

TEST(ChunkerTest, SplitSentencesOnTerminatorsFollowedBySpace) {
    const auto pieces = Chunker::split_sentences("Hi there! How are you?  Fine. Version 1.2 works");

    ASSERT_EQ(pieces.size(), 4u);
    EXPECT_EQ(pieces[0], "Hi there!");
    EXPECT_EQ(pieces[1], "How are you?");
    EXPECT_EQ(pieces[2], "Fine.");
    EXPECT_EQ(pieces[3], "Version 1.2 works");
}

TEST(ChunkerTest, InvalidOptionsAreRejected) {
    EXPECT_THROW(Chunker({0, 0}), std::invalid_argument);
    EXPECT_THROW(Chunker({100, 100}), std::invalid_argument);
    EXPECT_THROW(Chunker({100, 250}), std::invalid_argument);
    EXPECT_NO_THROW(Chunker({100, 0}));
    EXPECT_NO_THROW(Chunker({100, 99}));
}
