#ifndef DOCMILL_TEXT_UTILS_HPP
#define DOCMILL_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace docmill {

    /// @return True for the ASCII whitespace characters (space, \t, \n, \v, \f, \r).
    [[nodiscard]] constexpr bool is_space(const char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    /// @return `s` without leading and trailing whitespace.
    [[nodiscard]] std::string_view trim(std::string_view s) noexcept;

    /// @return True if `s` contains only whitespace (or is empty).
    [[nodiscard]] bool is_blank(std::string_view s) noexcept;

    /// @return True if `s` is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
    [[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

    /**
     * @brief Decodes `s` as UTF-8, replacing each invalid sequence with U+FFFD.
     */
    [[nodiscard]] std::string sanitize_utf8(std::string_view s);

    /// @return Number of Unicode code points in a UTF-8 string.
    [[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

    /**
     * @brief Moves `pos` forward to the start of the next UTF-8 character.
     * @return `pos` itself if it already sits on a character boundary, at most `s.size()`.
     */
    [[nodiscard]] std::size_t utf8_boundary_forward(std::string_view s, std::size_t pos) noexcept;

    /**
     * @brief Moves `pos` backward to the start of the UTF-8 character containing it.
     */
    [[nodiscard]] std::size_t utf8_boundary_backward(std::string_view s, std::size_t pos) noexcept;

    /// @return Number of whitespace-delimited words in `s`.
    [[nodiscard]] std::size_t count_words(std::string_view s) noexcept;

    /// @return ASCII-lowercased copy of `s`.
    [[nodiscard]] std::string to_lower(std::string_view s);

} // namespace docmill

#endif // DOCMILL_TEXT_UTILS_HPP
