#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include "profile/validation/email_validator.h"
#include <string>

namespace profile::model {

/**
 * Contact email of a profile (unique in storage).
 */
class Email {
public:
    static constexpr size_t MAX_LENGTH = 128;

private:
    std::string value_;

    explicit Email(std::string value) : value_(std::move(value)) {}

public:
    Email() = default;

    /**
     * @throws DomainException INVALID_EMAIL or TOO_LONG
     */
    static Email of(const std::string& email) {
        std::string normalized = utils::trim(email);

        if (!validation::isValidEmail(normalized)) {
            throw exception::DomainException(
                exception::ErrorKind::INVALID_EMAIL,
                "INVALID_PROFILE_EMAIL",
                "profile email is empty or insecure"
            );
        }
        if (normalized.length() > MAX_LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::TOO_LONG,
                "PROFILE_EMAIL_TOO_LONG",
                "profile email is too large"
            );
        }

        return Email(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const Email& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const Email& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
