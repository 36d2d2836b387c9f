/**
 * @file Profile.hpp
 * @brief Domain Model - Profile Entity
 *
 * A user profile whose every field is held as an already-validated value.
 * A Profile either satisfies all field invariants or was never constructed.
 */

#pragma once

#include "profile/model/ActivationToken.hpp"
#include "profile/model/AtHandle.hpp"
#include "profile/model/Email.hpp"
#include "profile/model/Entity.hpp"
#include "profile/model/PasswordHash.hpp"
#include "profile/model/PasswordSalt.hpp"
#include "profile/model/Phone.hpp"
#include "profile/model/ProfileId.hpp"
#include "profile/validation/sanitizer.h"
#include <json/json.h>
#include <optional>
#include <string>

namespace profile::model {

/**
 * @brief Profile entity
 *
 * Fields are only written through the validating setters. Each setter
 * normalizes, validates and then commits; on rejection it throws
 * DomainException and the previous value stays in place.
 *
 * Not thread-safe: callers own an instance exclusively while mutating it.
 */
class Profile : public Entity<ProfileId> {
public:
    /**
     * @brief Construct and validate every field
     *
     * Setters run in the order id, activation token, at handle, email,
     * hash, phone, salt. The first failure propagates unchanged.
     *
     * @param newProfileId UUID string
     * @param newActivationToken 32 hex characters, or std::nullopt
     * @param newAtHandle at handle, at most 32 characters after sanitizing
     * @param newEmail email address, at most 128 characters
     * @param newHash 128 hex characters
     * @param newPhone phone, at most 32 characters after sanitizing, or std::nullopt
     * @param newSalt 64 hex characters
     * @param sanitizer normalization for at handle and phone (default policy if empty)
     * @throws exception::DomainException if any field is invalid
     */
    Profile(const std::string& newProfileId,
            const std::optional<std::string>& newActivationToken,
            const std::string& newAtHandle,
            const std::string& newEmail,
            const std::string& newHash,
            const std::optional<std::string>& newPhone,
            const std::string& newSalt,
            validation::Sanitizer sanitizer = {});

    Profile(const ProfileId& newProfileId,
            const std::optional<std::string>& newActivationToken,
            const std::string& newAtHandle,
            const std::string& newEmail,
            const std::string& newHash,
            const std::optional<std::string>& newPhone,
            const std::string& newSalt,
            validation::Sanitizer sanitizer = {});

    /**
     * @brief Build a Profile from a JSON object carrying all seven fields
     *
     * Members are read and validated in constructor order, so the first
     * offending field determines the error. Absent or null required members
     * are validated as empty strings; absent or null optional members are
     * treated as not set. A non-string member is rejected with
     * INVALID_IDENTITY for profileId and EMPTY_OR_UNSAFE otherwise.
     *
     * @throws exception::DomainException if the document or any field is invalid
     */
    static Profile fromJson(const Json::Value& json, validation::Sanitizer sanitizer = {});

    // Getters
    const ProfileId& getProfileId() const { return id_; }
    std::optional<std::string> getProfileActivationToken() const;
    const std::string& getProfileAtHandle() const { return atHandle_.getValue(); }
    const std::string& getProfileEmail() const { return email_.getValue(); }
    const std::string& getProfileHash() const { return hash_.getValue(); }
    std::optional<std::string> getProfilePhone() const;
    const std::string& getProfileSalt() const { return salt_.getValue(); }

    // Validating setters
    void setProfileId(const std::string& newProfileId);
    void setProfileId(const ProfileId& newProfileId);
    void setProfileActivationToken(const std::optional<std::string>& newActivationToken);
    void setProfileAtHandle(const std::string& newAtHandle);
    void setProfileEmail(const std::string& newEmail);
    void setProfileHash(const std::string& newHash);
    void setProfilePhone(const std::optional<std::string>& newPhone);
    void setProfileSalt(const std::string& newSalt);

    /**
     * @brief Transport form of the profile
     *
     * Keys: profileId, profileActivationToken, profileAtHandle, profileEmail,
     * profilePhone. Hash and salt are never included; unset optional
     * fields are null.
     */
    Json::Value serialize() const;

private:
    /// Entity with default field values; only used while building one up
    explicit Profile(validation::Sanitizer sanitizer);

    /// Injected sanitizer, or the default policy once moved from
    const validation::Sanitizer& activeSanitizer() const;

    validation::Sanitizer sanitizer_;
    std::optional<ActivationToken> activationToken_;
    AtHandle atHandle_;
    Email email_;
    PasswordHash hash_;
    std::optional<Phone> phone_;
    PasswordSalt salt_;
};

} // namespace profile::model
