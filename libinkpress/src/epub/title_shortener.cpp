#include "../../include/title_shortener.hpp"
#include <array>
#include <regex>

namespace inkpress {

namespace {

constexpr std::size_t kMinSegmentLength = 20;
constexpr std::string_view kEllipsis = "...";

bool is_continuation(const unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

// byte offset of the n-th code point (or s.size())
std::size_t utf8_offset(const std::string_view s, std::size_t n) noexcept {
    std::size_t i = 0;
    while (i < s.size() && n > 0) {
        ++i;
        while (i < s.size() && is_continuation(static_cast<unsigned char>(s[i]))) ++i;
        --n;
    }
    return i;
}

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

const std::array<std::regex, 4>& suffix_patterns() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::array<std::regex, 4> patterns = {
        std::regex(R"(\s*(?:-|\xE2\x80\x93|\xE2\x80\x94)\s*Bloomberg.*$)", flags),
        std::regex(R"(\s*\(\d+\)\s*$)", flags),
        std::regex(R"(\s*\|\s*Bloomberg.*$)", flags),
        std::regex(R"(\s*:\s*Markets\s*Wrap\s*$)", flags),
    };
    return patterns;
}

} // namespace

std::size_t utf8_length(const std::string_view s) noexcept {
    std::size_t n = 0;
    for (const char c : s) {
        if (!is_continuation(static_cast<unsigned char>(c))) ++n;
    }
    return n;
}

std::string strip_title_suffixes(const std::string_view title) {
    std::string current(trim(title));
    // "Title (1) (2)" needs more than one pass
    while (true) {
        std::string next = current;
        for (const auto& pattern : suffix_patterns()) {
            next = std::regex_replace(next, pattern, "");
        }
        next = std::string(trim(next));
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

std::string shorten_title(const std::string_view title, const std::size_t max_len) {
    std::string stripped = strip_title_suffixes(title);
    if (utf8_length(stripped) <= max_len) {
        return stripped;
    }

    // natural break points, in priority order
    static constexpr std::array<std::string_view, 4> kBreaks = {":", " - ", " \xE2\x80\x93 ", ", "};
    for (const auto token : kBreaks) {
        const auto pos = stripped.find(token);
        if (pos == std::string::npos) continue;
        const std::string_view head = std::string_view(stripped).substr(0, pos);
        const auto head_len = utf8_length(head);
        if (head_len >= kMinSegmentLength && head_len <= max_len) {
            return strip_title_suffixes(head);
        }
    }

    if (max_len <= kEllipsis.size()) {
        return std::string(trim(std::string_view(stripped).substr(0, utf8_offset(stripped, max_len))));
    }

    // hard truncate, preferring a word boundary
    std::string_view truncated = std::string_view(stripped).substr(0, utf8_offset(stripped, max_len - kEllipsis.size()));
    const auto last_space = truncated.rfind(' ');
    if (last_space != std::string_view::npos && utf8_length(truncated.substr(0, last_space)) * 10 > max_len * 6) {
        truncated = truncated.substr(0, last_space);
    }
    return std::string(trim(truncated)) + std::string(kEllipsis);
}

} // namespace inkpress
