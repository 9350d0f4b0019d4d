/**
 * @file title_shortener.hpp
 * @brief Bounded-length display titles for the device's table of contents.
 */

#ifndef INKPRESS_TITLE_SHORTENER_HPP
#define INKPRESS_TITLE_SHORTENER_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace inkpress {

/// Default bound, in displayable characters (Unicode code points).
inline constexpr std::size_t kDefaultMaxTitleLength = 50;

/// Smallest bound the command line accepts.
inline constexpr std::size_t kMinTitleLength = 10;

/**
 * @brief Shortens an article title to at most @p max_len characters.
 *
 * @details Steps, first match wins:
 * 1. strip boilerplate suffixes (" - Bloomberg...", "| Bloomberg...",
 *    "(2)", ": Markets Wrap"), repeated until nothing more matches;
 * 2. return the trimmed result if it fits;
 * 3. cut at the first natural break (":", " - ", " – ", ", ") when the
 *    leading segment has between 20 and @p max_len characters;
 * 4. truncate to max_len - 3 characters, back off to a word boundary when
 *    one lies in the last 40% of the window, and append "...".
 *
 * Lengths count UTF-8 code points. The function is pure and idempotent.
 */
std::string shorten_title(std::string_view title, std::size_t max_len = kDefaultMaxTitleLength);

/// Step 1 of shorten_title() alone, result trimmed.
std::string strip_title_suffixes(std::string_view title);

/// Number of code points in a UTF-8 string (invalid bytes count as one each).
std::size_t utf8_length(std::string_view s) noexcept;

} // namespace inkpress

#endif // INKPRESS_TITLE_SHORTENER_HPP
