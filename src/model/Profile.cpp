/**
 * @file Profile.cpp
 * @brief Implementation of Profile domain model
 */

#include "profile/model/Profile.hpp"
#include <spdlog/spdlog.h>

namespace profile::model {

using exception::DomainException;
using exception::ErrorKind;

namespace {

void logRejection(const char* field, const DomainException& e) {
    spdlog::debug("Rejected {}: [{}] {}", field, e.getCode(), e.getMessage());
}

// Non-string members are rejected with the kind the field reports for unusable input
std::optional<std::string> optionalMember(const Json::Value& json, const char* key,
                                          ErrorKind kind = ErrorKind::EMPTY_OR_UNSAFE) {
    const Json::Value& member = json[key];
    if (member.isNull()) {
        return std::nullopt;
    }
    if (!member.isString()) {
        throw DomainException(kind, "INVALID_JSON_FIELD",
                              std::string(key) + " must be a string");
    }
    return member.asString();
}

std::string requiredMember(const Json::Value& json, const char* key,
                           ErrorKind kind = ErrorKind::EMPTY_OR_UNSAFE) {
    return optionalMember(json, key, kind).value_or("");
}

} // namespace

Profile::Profile(validation::Sanitizer sanitizer)
    : Entity<ProfileId>(ProfileId()),
      sanitizer_(sanitizer ? std::move(sanitizer) : validation::defaultSanitizer())
{}

Profile::Profile(const std::string& newProfileId,
                 const std::optional<std::string>& newActivationToken,
                 const std::string& newAtHandle,
                 const std::string& newEmail,
                 const std::string& newHash,
                 const std::optional<std::string>& newPhone,
                 const std::string& newSalt,
                 validation::Sanitizer sanitizer)
    : Profile(std::move(sanitizer))
{
    try {
        setProfileId(newProfileId);
        setProfileActivationToken(newActivationToken);
        setProfileAtHandle(newAtHandle);
        setProfileEmail(newEmail);
        setProfileHash(newHash);
        setProfilePhone(newPhone);
        setProfileSalt(newSalt);
    } catch (const DomainException& e) {
        spdlog::debug("Profile construction aborted: {} ({})",
                      e.getCode(), exception::toString(e.getKind()));
        throw;
    }
    createdAt_ = updatedAt_;
}

Profile::Profile(const ProfileId& newProfileId,
                 const std::optional<std::string>& newActivationToken,
                 const std::string& newAtHandle,
                 const std::string& newEmail,
                 const std::string& newHash,
                 const std::optional<std::string>& newPhone,
                 const std::string& newSalt,
                 validation::Sanitizer sanitizer)
    : Profile(newProfileId.toString(), newActivationToken, newAtHandle, newEmail,
              newHash, newPhone, newSalt, std::move(sanitizer)) {}

Profile Profile::fromJson(const Json::Value& json, validation::Sanitizer sanitizer) {
    if (!json.isObject()) {
        throw DomainException(ErrorKind::EMPTY_OR_UNSAFE, "INVALID_PROFILE_DOCUMENT",
                              "profile document must be a JSON object");
    }

    Profile profile(std::move(sanitizer));
    try {
        // Each member is read right before its setter runs
        profile.setProfileId(requiredMember(json, "profileId", ErrorKind::INVALID_IDENTITY));
        profile.setProfileActivationToken(optionalMember(json, "profileActivationToken"));
        profile.setProfileAtHandle(requiredMember(json, "profileAtHandle"));
        profile.setProfileEmail(requiredMember(json, "profileEmail"));
        profile.setProfileHash(requiredMember(json, "profileHash"));
        profile.setProfilePhone(optionalMember(json, "profilePhone"));
        profile.setProfileSalt(requiredMember(json, "profileSalt"));
    } catch (const DomainException& e) {
        spdlog::debug("Profile document rejected: {} ({})",
                      e.getCode(), exception::toString(e.getKind()));
        throw;
    }
    profile.createdAt_ = profile.updatedAt_;
    return profile;
}

const validation::Sanitizer& Profile::activeSanitizer() const {
    return sanitizer_ ? sanitizer_ : validation::defaultSanitizer();
}

std::optional<std::string> Profile::getProfileActivationToken() const {
    if (!activationToken_) {
        return std::nullopt;
    }
    return activationToken_->getValue();
}

std::optional<std::string> Profile::getProfilePhone() const {
    if (!phone_) {
        return std::nullopt;
    }
    return phone_->getValue();
}

void Profile::setProfileId(const std::string& newProfileId) {
    try {
        assignId(ProfileId::of(newProfileId));
    } catch (const DomainException& e) {
        logRejection("profileId", e);
        throw;
    }
}

void Profile::setProfileId(const ProfileId& newProfileId) {
    assignId(newProfileId);
}

void Profile::setProfileActivationToken(const std::optional<std::string>& newActivationToken) {
    if (!newActivationToken) {
        activationToken_.reset();
        touch();
        return;
    }
    try {
        activationToken_ = ActivationToken::of(*newActivationToken);
        touch();
    } catch (const DomainException& e) {
        logRejection("profileActivationToken", e);
        throw;
    }
}

void Profile::setProfileAtHandle(const std::string& newAtHandle) {
    try {
        atHandle_ = AtHandle::of(newAtHandle, activeSanitizer());
        touch();
    } catch (const DomainException& e) {
        logRejection("profileAtHandle", e);
        throw;
    }
}

void Profile::setProfileEmail(const std::string& newEmail) {
    try {
        email_ = Email::of(newEmail);
        touch();
    } catch (const DomainException& e) {
        logRejection("profileEmail", e);
        throw;
    }
}

void Profile::setProfileHash(const std::string& newHash) {
    try {
        hash_ = PasswordHash::of(newHash);
        touch();
    } catch (const DomainException& e) {
        logRejection("profileHash", e);
        throw;
    }
}

void Profile::setProfilePhone(const std::optional<std::string>& newPhone) {
    if (!newPhone) {
        phone_.reset();
        touch();
        return;
    }
    try {
        phone_ = Phone::of(*newPhone, activeSanitizer());
        touch();
    } catch (const DomainException& e) {
        logRejection("profilePhone", e);
        throw;
    }
}

void Profile::setProfileSalt(const std::string& newSalt) {
    try {
        salt_ = PasswordSalt::of(newSalt);
        touch();
    } catch (const DomainException& e) {
        logRejection("profileSalt", e);
        throw;
    }
}

Json::Value Profile::serialize() const {
    Json::Value json(Json::objectValue);

    json["profileId"] = id_.toString();

    auto token = getProfileActivationToken();
    json["profileActivationToken"] = token ? Json::Value(*token) : Json::Value(Json::nullValue);

    json["profileAtHandle"] = atHandle_.getValue();
    json["profileEmail"] = email_.getValue();

    auto phone = getProfilePhone();
    json["profilePhone"] = phone ? Json::Value(*phone) : Json::Value(Json::nullValue);

    return json;
}

} // namespace profile::model
