#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include "profile/validation/sanitizer.h"
#include <string>

namespace profile::model {

/**
 * Contact phone number. Free text after sanitization; no dialing-plan rules.
 */
class Phone {
public:
    static constexpr size_t MAX_LENGTH = 32;

private:
    std::string value_;

    explicit Phone(std::string value) : value_(std::move(value)) {}

public:
    Phone() = default;

    /**
     * @throws DomainException EMPTY_OR_UNSAFE or TOO_LONG
     */
    static Phone of(const std::string& phone,
                    const validation::Sanitizer& sanitize = validation::defaultSanitizer()) {
        std::string normalized = sanitize(utils::trim(phone));

        if (normalized.empty()) {
            throw exception::DomainException(
                exception::ErrorKind::EMPTY_OR_UNSAFE,
                "INVALID_PROFILE_PHONE",
                "profile phone is empty or insecure"
            );
        }
        if (normalized.length() > MAX_LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::TOO_LONG,
                "PROFILE_PHONE_TOO_LONG",
                "profile phone is too large"
            );
        }

        return Phone(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const Phone& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const Phone& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
