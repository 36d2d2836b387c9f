/**
 * @file email_validator.h
 * @brief Email address syntax validation
 */

#pragma once

#include <string>

namespace profile::validation {

/// @brief Longest local part accepted (RFC 5321 Section 4.5.3.1.1)
constexpr size_t EMAIL_LOCAL_PART_MAX = 64;

/// @brief Longest single domain label (RFC 1035 Section 2.3.4)
constexpr size_t EMAIL_DOMAIN_LABEL_MAX = 63;

/**
 * @brief Check email address syntax
 *
 * Rules:
 * - exactly one '@' between a non-empty local part and a domain
 * - local part is a dot-atom of at most 64 characters
 *   (no leading, trailing or consecutive dots)
 * - domain has at least two labels of 1-63 letters, digits or '-',
 *   none starting or ending with '-', and a non-numeric last label
 *
 * No surrounding whitespace is tolerated; trim first.
 *
 * @param email Candidate address
 * @return true if the address is syntactically valid
 */
bool isValidEmail(const std::string& email);

} // namespace profile::validation
