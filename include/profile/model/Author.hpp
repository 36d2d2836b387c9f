/**
 * @file Author.hpp
 * @brief Author reference domain model
 *
 * Lightweight reference to an author record. Only the id is validated on
 * write; email, hash and username arrive from storage and are read-only.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include "profile/exception/DomainException.hpp"

namespace profile::model {

/**
 * @brief Author reference entity
 */
class Author {
public:
    Author() = default;

    /**
     * @brief Constructor with trusted persisted values
     */
    Author(int64_t authorId,
           const std::string& authorEmail,
           const std::string& authorHash,
           const std::string& authorUsername)
        : authorId_(authorId),
          authorEmail_(authorEmail),
          authorHash_(authorHash),
          authorUsername_(authorUsername)
    {}

    // Getters
    int64_t getAuthorId() const { return authorId_; }
    const std::string& getAuthorEmail() const { return authorEmail_; }
    const std::string& getAuthorHash() const { return authorHash_; }
    const std::string& getAuthorUsername() const { return authorUsername_; }

    /**
     * @brief Store an integer author id
     *
     * Only integral types bind here; floating-point, bool and char values do not
     * compile.
     *
     * @throws exception::DomainException INVALID_IDENTITY (UNEXPECTED_VALUE category)
     *         if an unsigned value does not fit in int64_t
     */
    template<typename T,
             typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                         !std::is_same_v<T, char>>>
    void setAuthorId(T newAuthorId) {
        if constexpr (std::is_unsigned_v<T>) {
            if (static_cast<uint64_t>(newAuthorId) >
                static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw exception::DomainException(
                    exception::ErrorKind::INVALID_IDENTITY,
                    exception::ErrorCategory::UNEXPECTED_VALUE,
                    "INVALID_AUTHOR_ID",
                    "author id is out of range"
                );
            }
        }
        authorId_ = static_cast<int64_t>(newAuthorId);
    }

    /**
     * @brief Parse and store the author id
     * @throws exception::DomainException INVALID_IDENTITY (UNEXPECTED_VALUE category)
     *         if the value is not an integer
     */
    void setAuthorId(const std::string& newAuthorId);

private:
    int64_t authorId_ = 0;
    std::string authorEmail_;
    std::string authorHash_;
    std::string authorUsername_;
};

} // namespace profile::model
