#ifndef DOCMILL_RANDOM_UTILS_HPP
#define DOCMILL_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers used to name temporary render directories.
 *
 * The generator (std::mt19937_64) is thread-local, so pages rendered by
 * concurrent pipelines never share state.
 */
namespace docmill::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Random lowercase hex suffix (16 characters) for file and directory names.
     */
    std::string random_suffix();

} // namespace docmill::RandomUtils

#endif // DOCMILL_RANDOM_UTILS_HPP
