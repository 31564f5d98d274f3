#include "../../include/text_utils.hpp"

#include <cctype>

namespace docmill {

    namespace {
        constexpr bool is_continuation(const unsigned char c) noexcept {
            return (c & 0xC0) == 0x80;
        }

        // Length of the well-formed UTF-8 sequence starting at s[i], or 0 if malformed.
        std::size_t valid_sequence_length(const std::string_view s, const std::size_t i) noexcept {
            const auto c0 = static_cast<unsigned char>(s[i]);
            if (c0 < 0x80) return 1;

            std::size_t len;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c0 >= 0xC2 && c0 <= 0xDF) {
                len = 2;
            } else if (c0 >= 0xE0 && c0 <= 0xEF) {
                len = 3;
                if (c0 == 0xE0) lo = 0xA0;      // overlong
                else if (c0 == 0xED) hi = 0x9F; // surrogates
            } else if (c0 >= 0xF0 && c0 <= 0xF4) {
                len = 4;
                if (c0 == 0xF0) lo = 0x90;      // overlong
                else if (c0 == 0xF4) hi = 0x8F; // above U+10FFFF
            } else {
                return 0;
            }

            if (i + len > s.size()) return 0;
            const auto c1 = static_cast<unsigned char>(s[i + 1]);
            if (c1 < lo || c1 > hi) return 0;
            for (std::size_t k = 2; k < len; ++k) {
                if (!is_continuation(static_cast<unsigned char>(s[i + k]))) return 0;
            }
            return len;
        }
    }

    std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    }

    bool is_blank(const std::string_view s) noexcept {
        return trim(s).empty();
    }

    bool is_valid_utf8(const std::string_view s) noexcept {
        std::size_t i = 0;
        while (i < s.size()) {
            const auto len = valid_sequence_length(s, i);
            if (len == 0) return false;
            i += len;
        }
        return true;
    }

    std::string sanitize_utf8(const std::string_view s) {
        static constexpr std::string_view replacement = "\xEF\xBF\xBD";
        std::string out;
        out.reserve(s.size());
        std::size_t i = 0;
        while (i < s.size()) {
            const auto len = valid_sequence_length(s, i);
            if (len == 0) {
                out += replacement;
                ++i;
                // a malformed lead swallows its stray continuation bytes
                while (i < s.size() && is_continuation(static_cast<unsigned char>(s[i]))) ++i;
                continue;
            }
            out.append(s.substr(i, len));
            i += len;
        }
        return out;
    }

    std::size_t utf8_length(const std::string_view s) noexcept {
        std::size_t n = 0;
        for (const char c : s) {
            if (!is_continuation(static_cast<unsigned char>(c))) ++n;
        }
        return n;
    }

    std::size_t utf8_boundary_forward(const std::string_view s, std::size_t pos) noexcept {
        if (pos >= s.size()) return s.size();
        while (pos < s.size() && is_continuation(static_cast<unsigned char>(s[pos]))) ++pos;
        return pos;
    }

    std::size_t utf8_boundary_backward(const std::string_view s, std::size_t pos) noexcept {
        if (pos >= s.size()) return s.size();
        while (pos > 0 && is_continuation(static_cast<unsigned char>(s[pos]))) --pos;
        return pos;
    }

    std::size_t count_words(const std::string_view s) noexcept {
        std::size_t words = 0;
        bool in_word = false;
        for (const char c : s) {
            if (is_space(c)) {
                in_word = false;
            } else if (!in_word) {
                in_word = true;
                ++words;
            }
        }
        return words;
    }

    std::string to_lower(const std::string_view s) {
        std::string out(s);
        for (auto& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

} // namespace docmill
