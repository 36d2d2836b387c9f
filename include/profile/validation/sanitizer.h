/**
 * @file sanitizer.h
 * @brief Safe-string normalization for free-text profile fields
 *
 * Default policy:
 * - Markup is stripped. A '<' opens a tag that runs through the next '>';
 *   an unterminated tag removes the rest of the input.
 * - ASCII control characters (0x00-0x1F, 0x7F) are removed.
 * - Quotes are kept as-is. No other character is altered.
 *
 * The sanitizer does not trim; callers trim before sanitizing.
 */

#pragma once

#include <functional>
#include <string>

namespace profile::validation {

/// @brief Normalization function applied to at-handle and phone values
using Sanitizer = std::function<std::string(const std::string&)>;

/**
 * @brief Apply the default character policy
 */
std::string sanitizeString(const std::string& input);

/**
 * @brief Default sanitizer as an injectable function object
 */
const Sanitizer& defaultSanitizer();

} // namespace profile::validation
