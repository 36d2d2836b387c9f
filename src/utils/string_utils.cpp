/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "profile/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace profile {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool isHexDigits(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::optional<int64_t> parseInteger(const std::string& str) {
    std::string digits = trim(str);
    if (digits.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    size_t pos = 0;
    if (digits[0] == '+' || digits[0] == '-') {
        negative = (digits[0] == '-');
        pos = 1;
    }
    if (pos == digits.length()) {
        return std::nullopt;
    }

    // "0" is allowed, "007" is not
    if (digits[pos] == '0' && digits.length() - pos > 1) {
        return std::nullopt;
    }

    // Accumulate as a negative number so INT64_MIN fits
    const int64_t min = std::numeric_limits<int64_t>::min();
    int64_t value = 0;
    for (size_t i = pos; i < digits.length(); ++i) {
        unsigned char c = static_cast<unsigned char>(digits[i]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        int digit = c - '0';
        if (value < (min + digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 - digit;
    }

    if (!negative) {
        if (value == min) {
            return std::nullopt;
        }
        value = -value;
    }
    return value;
}

} // namespace utils
} // namespace profile
