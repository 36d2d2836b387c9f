/**
 * @file profile_document.cpp
 * @brief Implementation of profile document validation
 */

#include "profile/service/profile_document.h"
#include "profile/model/Profile.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace profile::service {

Json::Value errorBody(const exception::DomainException& e) {
    Json::Value error(Json::objectValue);
    error["kind"] = exception::toString(e.getKind());
    error["category"] = exception::toString(e.getCategory());
    error["code"] = e.getCode();
    error["message"] = e.getMessage();

    Json::Value body(Json::objectValue);
    body["error"] = error;
    return body;
}

DocumentResult validateDocument(std::istream& input, validation::Sanitizer sanitizer) {
    DocumentResult result;

    Json::Value document;
    Json::CharReaderBuilder reader;
    std::string errors;
    if (!Json::parseFromStream(reader, input, &document, &errors)) {
        spdlog::error("Input is not valid JSON: {}", errors);
        result.status = DocumentStatus::UNREADABLE;
        return result;
    }

    try {
        auto validated = model::Profile::fromJson(document, std::move(sanitizer));
        spdlog::info("Profile {} is valid", validated.getProfileId().toString());
        result.status = DocumentStatus::VALID;
        result.body = validated.serialize();
    } catch (const exception::DomainException& e) {
        spdlog::warn("Profile rejected: {}", e.getCode());
        result.status = DocumentStatus::REJECTED;
        result.body = errorBody(e);
    }
    return result;
}

} // namespace profile::service
