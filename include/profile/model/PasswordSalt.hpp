#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include <string>

namespace profile::model {

/**
 * Password salt of a profile: 64 lowercase hex characters (256 bits).
 * Secret material: never serialized for transport.
 */
class PasswordSalt {
public:
    static constexpr size_t LENGTH = 64;

private:
    std::string value_;

    explicit PasswordSalt(std::string value) : value_(std::move(value)) {}

public:
    PasswordSalt() = default;

    /**
     * @throws DomainException EMPTY_OR_UNSAFE, INVALID_FORMAT or WRONG_LENGTH
     */
    static PasswordSalt of(const std::string& hexValue) {
        std::string normalized = utils::toLower(utils::trim(hexValue));

        // Same empty-value rule as PasswordHash
        if (normalized.empty()) {
            throw exception::DomainException(
                exception::ErrorKind::EMPTY_OR_UNSAFE,
                "INVALID_PROFILE_SALT",
                "profile password salt empty or insecure"
            );
        }
        if (!utils::isHexDigits(normalized)) {
            throw exception::DomainException(
                exception::ErrorKind::INVALID_FORMAT,
                "INVALID_PROFILE_SALT_FORMAT",
                "profile password salt is not hexadecimal"
            );
        }
        if (normalized.length() != LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::WRONG_LENGTH,
                "PROFILE_SALT_WRONG_LENGTH",
                "profile salt must be 64 characters. Got: " + std::to_string(normalized.length())
            );
        }

        return PasswordSalt(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const PasswordSalt& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const PasswordSalt& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
