#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include <string>

namespace profile::model {

/**
 * One-time account activation token.
 *
 * 32 lowercase hex characters. Format is checked; the token itself is
 * not verified here.
 */
class ActivationToken {
public:
    static constexpr size_t LENGTH = 32;

private:
    std::string value_;

    explicit ActivationToken(std::string value) : value_(std::move(value)) {}

public:
    ActivationToken() = default;

    /**
     * @throws DomainException INVALID_FORMAT or WRONG_LENGTH, both in the
     *         OUT_OF_RANGE category
     */
    static ActivationToken of(const std::string& token) {
        std::string normalized = utils::toLower(utils::trim(token));

        if (!utils::isHexDigits(normalized)) {
            throw exception::DomainException(
                exception::ErrorKind::INVALID_FORMAT,
                exception::ErrorCategory::OUT_OF_RANGE,
                "INVALID_ACTIVATION_TOKEN",
                "activation token is not valid"
            );
        }
        if (normalized.length() != LENGTH) {
            throw exception::DomainException(
                exception::ErrorKind::WRONG_LENGTH,
                "ACTIVATION_TOKEN_WRONG_LENGTH",
                "activation token must be 32 characters"
            );
        }

        return ActivationToken(std::move(normalized));
    }

    const std::string& getValue() const { return value_; }

    bool operator==(const ActivationToken& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ActivationToken& other) const {
        return !(*this == other);
    }
};

} // namespace profile::model
