#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include <string>

namespace profile::model {

/**
 * Password hash of a profile.
 *
 * Hex-encoded 512-bit digest (128 characters, lowercase).
 * Secret material: never serialized for transport.
 */
class PasswordHash {
public:
    static constexpr size_t LENGTH = 128;

private:
    std::string value_;  // Hex-encoded hash (lowercase)

    explicit PasswordHash(std::string value) : value_(std::move(value)) {}

public:
    PasswordHash() = default;

    /**
     * @throws DomainException EMPTY_OR_UNSAFE, INVALID_FORMAT or WRONG_LENGTH
     */
    static PasswordHash of(const std::string& hexValue) {
        std::string normalized = utils::toLower(utils::trim(hexValue));

        if (normalized.empty()) {
            throw exception::DomainException(
                exception::ErrorKind::EMPTY_OR_UNSAFE,
                "INVALID_PROFILE_HASH",
                "profile password hash empty or insecure"
            );
        }
        if (!utils::isHexDigits(normalized)) {
            throw exception::DomainException(
                exception::ErrorKind::INVALID_FORMAT,
                "INVALID_PROFILE_HASH_FORMAT",
                "profile password hash is not hexadecimal"
            );
        }
        if (normalized.length() != LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::WRONG_LENGTH,
                "PROFILE_HASH_WRONG_LENGTH",
                "profile hash must be 128 characters. Got: " + std::to_string(normalized.length())
            );
        }

        return PasswordHash(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const PasswordHash& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const PasswordHash& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
