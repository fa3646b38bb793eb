#pragma once

/**
 * String utilities for the trade finder
 *
 * Small helpers shared by the CLI, config loader and AI output parser.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace tradefinder {
namespace util {

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * Split a comma-separated string into trimmed, uppercase, non-empty items.
 *
 * @param s Comma-separated string (e.g., "NQ, es ,YM")
 * @return {"NQ", "ES", "YM"}
 */
inline std::vector<std::string> split_symbols(const std::string& s) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = to_upper(trim(item));
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty())
        return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

/**
 * Remove a surrounding markdown code fence (```json ... ``` or ``` ... ```).
 * Text without a fence is returned trimmed.
 */
inline std::string strip_code_fence(const std::string& text) {
    std::string clean = trim(text);
    if (clean.rfind("```json", 0) == 0) {
        clean = clean.substr(7);
    } else if (clean.rfind("```", 0) == 0) {
        clean = clean.substr(3);
    }
    if (clean.size() >= 3 && clean.compare(clean.size() - 3, 3, "```") == 0) {
        clean = clean.substr(0, clean.size() - 3);
    }
    return trim(clean);
}

/**
 * Parse a strictly positive decimal integer (digits only, no sign, no spaces).
 * Returns false on anything else, including overflow.
 */
inline bool parse_positive_ms(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18)
        return false;
    int64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
    }
    if (value <= 0)
        return false;
    out = value;
    return true;
}

}  // namespace util
}  // namespace tradefinder
