/**
 * @file profile_document.h
 * @brief Validate a serialized profile document
 *
 * Turns raw JSON text into either the profile's transport form or an error
 * body, with the status the profile_validate tool exits with.
 */

#pragma once

#include <istream>
#include <json/json.h>
#include "profile/exception/DomainException.hpp"
#include "profile/validation/sanitizer.h"

namespace profile::service {

/**
 * @brief Outcome of validating one document
 *
 * Values double as process exit codes.
 */
enum class DocumentStatus {
    VALID = 0,
    UNREADABLE = 1,
    REJECTED = 2
};

struct DocumentResult {
    DocumentStatus status = DocumentStatus::UNREADABLE;
    Json::Value body;  ///< serialize() output, error body, or null when unreadable
};

/**
 * @brief Error body: {"error": {"kind", "category", "code", "message"}}
 */
Json::Value errorBody(const exception::DomainException& e);

/**
 * @brief Parse and validate one JSON profile document
 *
 * Input that is not JSON yields UNREADABLE with a null body. A document
 * that fails validation yields REJECTED with errorBody() of the first
 * offending field.
 */
DocumentResult validateDocument(std::istream& input, validation::Sanitizer sanitizer = {});

} // namespace profile::service
