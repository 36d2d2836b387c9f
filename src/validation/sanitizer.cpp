/**
 * @file sanitizer.cpp
 * @brief Default safe-string policy
 */

#include "profile/validation/sanitizer.h"

namespace profile::validation {

std::string sanitizeString(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    bool inTag = false;
    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (inTag) {
            if (c == '>') {
                inTag = false;
            }
            continue;
        }
        if (c == '<') {
            inTag = true;
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            continue;
        }
        result.push_back(ch);
    }

    return result;
}

const Sanitizer& defaultSanitizer() {
    static const Sanitizer sanitizer = sanitizeString;
    return sanitizer;
}

} // namespace profile::validation
