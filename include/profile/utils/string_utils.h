/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Normalization helpers shared by the field validators.
 */

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace profile {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string (ASCII only)
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check that every character is a hexadecimal digit
 *
 * @param str Input string
 * @return false for the empty string
 */
bool isHexDigits(const std::string& str);

/**
 * @brief Parse a strict decimal integer
 *
 * Surrounding whitespace and a leading sign are allowed. Leading zeros,
 * fractional parts, exponents and values outside int64 are rejected.
 *
 * @param str Input string
 * @return Parsed value, or std::nullopt if the input is not an integer
 */
std::optional<int64_t> parseInteger(const std::string& str);

} // namespace utils
} // namespace profile
