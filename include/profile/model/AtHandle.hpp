#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include "profile/validation/sanitizer.h"
#include <string>

namespace profile::model {

/**
 * Public at-handle of a profile (unique in storage).
 */
class AtHandle {
public:
    static constexpr size_t MAX_LENGTH = 32;

private:
    std::string value_;

    explicit AtHandle(std::string value) : value_(std::move(value)) {}

public:
    AtHandle() = default;

    /**
     * Trim, sanitize, then bound-check.
     *
     * @throws DomainException EMPTY_OR_UNSAFE or TOO_LONG
     */
    static AtHandle of(const std::string& handle,
                       const validation::Sanitizer& sanitize = validation::defaultSanitizer()) {
        std::string normalized = sanitize(utils::trim(handle));

        if (normalized.empty()) {
            throw exception::DomainException(
                exception::ErrorKind::EMPTY_OR_UNSAFE,
                "INVALID_PROFILE_AT_HANDLE",
                "profile at handle is empty or insecure"
            );
        }
        if (normalized.length() > MAX_LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::TOO_LONG,
                "PROFILE_AT_HANDLE_TOO_LONG",
                "profile at handle is too large"
            );
        }

        return AtHandle(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const AtHandle& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const AtHandle& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
