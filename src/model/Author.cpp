/**
 * @file Author.cpp
 * @brief Implementation of Author domain model
 */

#include "profile/model/Author.hpp"
#include "profile/exception/DomainException.hpp"
#include "profile/utils/string_utils.h"
#include <spdlog/spdlog.h>

namespace profile::model {

void Author::setAuthorId(const std::string& newAuthorId) {
    auto parsed = utils::parseInteger(newAuthorId);
    if (!parsed) {
        spdlog::debug("Rejected authorId: not a valid integer");
        throw exception::DomainException(
            exception::ErrorKind::INVALID_IDENTITY,
            exception::ErrorCategory::UNEXPECTED_VALUE,
            "INVALID_AUTHOR_ID",
            "author id is not a valid integer"
        );
    }
    authorId_ = *parsed;
}

} // namespace profile::model
