#ifndef DOCMILL_CONTENT_HASH_HPP
#define DOCMILL_CONTENT_HASH_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace docmill {

    /// Length of the deduplication key in hex characters.
    inline constexpr std::size_t kDocumentHashLength = 16;

    /**
     * @brief Lowercase hex SHA-256 digest of `data` (OpenSSL EVP).
     * @throws std::runtime_error if the digest cannot be computed.
     */
    [[nodiscard]] std::string sha256_hex(std::string_view data);

    /**
     * @brief Deduplication key of an extracted text: the first 16 hex characters of its SHA-256.
     *
     * Not a security primitive.
     */
    [[nodiscard]] std::string document_hash(std::string_view text);

} // namespace docmill

#endif // DOCMILL_CONTENT_HASH_HPP
