#pragma once

#include "profile/exception/DomainException.hpp"
#include "profile/utils/UuidUtil.hpp"
#include <string>

namespace profile::model {

/**
 * Unique identifier for a Profile (128-bit UUID).
 */
class ProfileId {
private:
    utils::UuidUtil::Bytes bytes_{};

    explicit ProfileId(const utils::UuidUtil::Bytes& bytes) : bytes_(bytes) {}

public:
    /// Nil UUID; only exists until a Profile assigns its real id
    ProfileId() = default;

    /**
     * Create new ProfileId with a generated version 4 UUID.
     */
    static ProfileId newId() {
        return ProfileId(utils::UuidUtil::generate());
    }

    /**
     * Create ProfileId from a UUID string.
     *
     * @throws DomainException INVALID_IDENTITY if the string is not a UUID
     */
    static ProfileId of(const std::string& id) {
        auto bytes = utils::UuidUtil::parse(id);
        if (!bytes) {
            throw exception::DomainException(
                exception::ErrorKind::INVALID_IDENTITY,
                "INVALID_PROFILE_ID",
                "profile id is not a valid uuid"
            );
        }
        return ProfileId(*bytes);
    }

    /**
     * Create ProfileId from its 16-byte binary form.
     */
    static ProfileId of(const utils::UuidUtil::Bytes& bytes) {
        return ProfileId(bytes);
    }

    const utils::UuidUtil::Bytes& getBytes() const { return bytes_; }

    /**
     * Canonical lowercase string form.
     */
    std::string toString() const {
        return utils::UuidUtil::toString(bytes_);
    }

    int version() const {
        return utils::UuidUtil::version(bytes_);
    }

    bool operator==(const ProfileId& other) const {
        return bytes_ == other.bytes_;
    }

    bool operator!=(const ProfileId& other) const {
        return !(*this == other);
    }

    bool operator<(const ProfileId& other) const {
        return bytes_ < other.bytes_;
    }
};

} // namespace profile::model
