#ifndef INKPRESS_RANDOM_UTILS_HPP
#define INKPRESS_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to build unique names for
 * temporary directories and files.
 */
namespace inkpress::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random string suffix for file and directory names.
     * @return A string representation of a random 64-bit integer.
     */
    std::string random_suffix();

} // namespace inkpress::RandomUtils

#endif // INKPRESS_RANDOM_UTILS_HPP
