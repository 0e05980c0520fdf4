#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace PriceSync {

// ASCII-only text helpers shared by the detector, deduplicator and matcher.
// Non-ASCII bytes are treated as punctuation.

inline bool is_ascii_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

inline bool is_ascii_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_ascii_space(s[begin])) ++begin;
    while (end > begin && is_ascii_space(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

/**
 * @brief Lowercase, drop everything but [a-z0-9] and whitespace, collapse runs
 * of whitespace to a single space and trim.
 *
 * "Denon  AVR-X1800H!" -> "denon avrx1800h"
 */
inline std::string normalize_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_ascii_alnum(c)) {
            if (pending_space && !out.empty()) out.push_back(' ');
            pending_space = false;
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (is_ascii_space(c)) {
            pending_space = true;
        }
    }
    return out;
}

// Lowercase alphanumerics only; no separators of any kind survive.
inline std::string compact_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (is_ascii_alnum(c)) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

inline bool contains_ci(std::string_view haystack, std::string_view needle) {
    return contains(to_lower(haystack), to_lower(needle));
}

} // namespace PriceSync
