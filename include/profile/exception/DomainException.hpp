/**
 * @file DomainException.hpp
 * @brief Domain layer exception class
 */

#pragma once

#include <stdexcept>
#include <string>

namespace profile::exception {

/**
 * @brief What rule a rejected value broke
 */
enum class ErrorKind {
    INVALID_IDENTITY,  ///< Not parseable as the identity type (UUID or integer)
    EMPTY_OR_UNSAFE,   ///< Empty, or empty after sanitization
    INVALID_FORMAT,    ///< Not composed solely of hexadecimal digits
    WRONG_LENGTH,      ///< Violates an exact length
    TOO_LONG,          ///< Violates a maximum length
    INVALID_EMAIL      ///< Fails email syntax validation
};

/**
 * @brief Coarse category a caller may branch on
 */
enum class ErrorCategory {
    INVALID_ARGUMENT,
    OUT_OF_RANGE,
    UNEXPECTED_VALUE
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case ErrorKind::EMPTY_OR_UNSAFE:  return "EMPTY_OR_UNSAFE";
        case ErrorKind::INVALID_FORMAT:   return "INVALID_FORMAT";
        case ErrorKind::WRONG_LENGTH:     return "WRONG_LENGTH";
        case ErrorKind::TOO_LONG:         return "TOO_LONG";
        case ErrorKind::INVALID_EMAIL:    return "INVALID_EMAIL";
    }
    return "UNKNOWN";
}

inline std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCategory::OUT_OF_RANGE:     return "OUT_OF_RANGE";
        case ErrorCategory::UNEXPECTED_VALUE: return "UNEXPECTED_VALUE";
    }
    return "UNKNOWN";
}

/**
 * @brief Default category for a kind (length bounds are range violations)
 */
inline ErrorCategory defaultCategory(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::WRONG_LENGTH:
        case ErrorKind::TOO_LONG:
            return ErrorCategory::OUT_OF_RANGE;
        default:
            return ErrorCategory::INVALID_ARGUMENT;
    }
}

/**
 * @brief Exception for domain layer errors
 *
 * Thrown when a field value violates its invariant. The kind, code and
 * category travel unchanged from the validator that detected the problem
 * to whoever catches it.
 */
class DomainException : public std::runtime_error {
private:
    ErrorKind kind_;
    ErrorCategory category_;
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param kind Rule that was violated
     * @param code Error code (e.g., "INVALID_PROFILE_EMAIL")
     * @param message Human-readable error message
     */
    DomainException(ErrorKind kind, std::string code, std::string message)
        : DomainException(kind, defaultCategory(kind), std::move(code), std::move(message)) {}

    DomainException(ErrorKind kind, ErrorCategory category, std::string code, std::string message)
        : std::runtime_error(message),
          kind_(kind),
          category_(category),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] ErrorKind getKind() const noexcept {
        return kind_;
    }

    [[nodiscard]] ErrorCategory getCategory() const noexcept {
        return category_;
    }

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

} // namespace profile::exception
