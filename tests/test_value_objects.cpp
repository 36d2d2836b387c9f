/**
 * @file test_value_objects.cpp
 * @brief Unit tests for the per-field value types
 */

#include <gtest/gtest.h>
#include <cctype>
#include <profile/model/ActivationToken.hpp>
#include <profile/model/AtHandle.hpp>
#include <profile/model/Email.hpp>
#include <profile/model/PasswordHash.hpp>
#include <profile/model/PasswordSalt.hpp>
#include <profile/model/Phone.hpp>
#include <profile/model/ProfileId.hpp>
#include "test_helpers.h"

using namespace profile::model;
using profile::exception::DomainException;
using profile::exception::ErrorCategory;
using profile::exception::ErrorKind;
using namespace test_helpers;

namespace {

template<typename Fn>
DomainException captureError(Fn&& fn) {
    try {
        fn();
    } catch (const DomainException& e) {
        return e;
    }
    ADD_FAILURE() << "expected DomainException";
    return DomainException(ErrorKind::INVALID_IDENTITY, "NONE", "no exception thrown");
}

} // namespace

// ============================================================================
// ProfileId
// ============================================================================

TEST(ProfileIdTest, Of_ValidString) {
    auto id = ProfileId::of(VALID_UUID);
    EXPECT_EQ(id.toString(), VALID_UUID);
    EXPECT_EQ(id.version(), 4);
}

TEST(ProfileIdTest, Of_UppercaseNormalized) {
    auto id = ProfileId::of("3F2504E0-4F89-41D3-9A0C-0305E82C3301");
    EXPECT_EQ(id, ProfileId::of(VALID_UUID));
    EXPECT_EQ(id.toString(), VALID_UUID);
}

TEST(ProfileIdTest, Of_Bytes) {
    auto fromString = ProfileId::of(VALID_UUID);
    auto fromBytes = ProfileId::of(fromString.getBytes());
    EXPECT_EQ(fromString, fromBytes);
}

TEST(ProfileIdTest, Of_InvalidString) {
    auto e = captureError([] { ProfileId::of("not-a-uuid"); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_IDENTITY);
    EXPECT_EQ(e.getCategory(), ErrorCategory::INVALID_ARGUMENT);
    EXPECT_EQ(e.getCode(), "INVALID_PROFILE_ID");
}

TEST(ProfileIdTest, Of_Empty) {
    EXPECT_THROW(ProfileId::of(""), DomainException);
}

TEST(ProfileIdTest, NewId_Version4) {
    auto a = ProfileId::newId();
    auto b = ProfileId::newId();
    EXPECT_EQ(a.version(), 4);
    EXPECT_NE(a, b);
    EXPECT_EQ(ProfileId::of(a.toString()), a);
}

// ============================================================================
// ActivationToken
// ============================================================================

TEST(ActivationTokenTest, Of_NormalizesCaseAndWhitespace) {
    auto token = ActivationToken::of("  " + repeat("ABCDEF0123456789", 2) + "\n");
    EXPECT_EQ(token.getValue(), repeat("abcdef0123456789", 2));
}

TEST(ActivationTokenTest, Of_NonHex) {
    auto e = captureError([] { ActivationToken::of(repeat("g", 32)); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_FORMAT);
    EXPECT_EQ(e.getCategory(), ErrorCategory::OUT_OF_RANGE);
}

TEST(ActivationTokenTest, Of_Empty) {
    auto e = captureError([] { ActivationToken::of(""); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_FORMAT);
    EXPECT_EQ(e.getCategory(), ErrorCategory::OUT_OF_RANGE);
}

TEST(ActivationTokenTest, Of_WrongLength) {
    for (size_t len : {1u, 31u, 33u, 64u}) {
        auto e = captureError([len] { ActivationToken::of(std::string(len, 'a')); });
        EXPECT_EQ(e.getKind(), ErrorKind::WRONG_LENGTH) << "length " << len;
        EXPECT_EQ(e.getCategory(), ErrorCategory::OUT_OF_RANGE);
    }
}

// ============================================================================
// AtHandle
// ============================================================================

TEST(AtHandleTest, Of_TrimsAndSanitizes) {
    EXPECT_EQ(AtHandle::of("  @kestrel  ").getValue(), "@kestrel");
    EXPECT_EQ(AtHandle::of("<b>@kestrel</b>").getValue(), "@kestrel");
}

TEST(AtHandleTest, Of_EmptyOrUnsafe) {
    EXPECT_EQ(captureError([] { AtHandle::of(""); }).getKind(), ErrorKind::EMPTY_OR_UNSAFE);
    EXPECT_EQ(captureError([] { AtHandle::of("   "); }).getKind(), ErrorKind::EMPTY_OR_UNSAFE);
    EXPECT_EQ(captureError([] { AtHandle::of("<script></script>"); }).getKind(),
              ErrorKind::EMPTY_OR_UNSAFE);
}

TEST(AtHandleTest, Of_LengthBound) {
    EXPECT_NO_THROW(AtHandle::of(std::string(32, 'h')));
    auto e = captureError([] { AtHandle::of(std::string(33, 'h')); });
    EXPECT_EQ(e.getKind(), ErrorKind::TOO_LONG);
    EXPECT_EQ(e.getCategory(), ErrorCategory::OUT_OF_RANGE);
}

TEST(AtHandleTest, Of_LengthCountedAfterSanitizing) {
    EXPECT_NO_THROW(AtHandle::of("<em>" + std::string(32, 'h') + "</em>"));
}

TEST(AtHandleTest, Of_InjectedSanitizer) {
    profile::validation::Sanitizer upper = [](const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return out;
    };
    EXPECT_EQ(AtHandle::of("<b>x</b>", upper).getValue(), "<B>X</B>");
}

// ============================================================================
// Email
// ============================================================================

TEST(EmailTest, Of_Valid) {
    EXPECT_EQ(Email::of("user@example.com").getValue(), "user@example.com");
}

TEST(EmailTest, Of_Trimmed) {
    EXPECT_EQ(Email::of("  user@example.com \t").getValue(), "user@example.com");
}

TEST(EmailTest, Of_Invalid) {
    auto e = captureError([] { Email::of("not-an-email"); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_EMAIL);
    EXPECT_EQ(e.getCategory(), ErrorCategory::INVALID_ARGUMENT);
}

TEST(EmailTest, Of_Empty) {
    EXPECT_EQ(captureError([] { Email::of(""); }).getKind(), ErrorKind::INVALID_EMAIL);
}

TEST(EmailTest, Of_LengthBound) {
    // 64 + 1 + 59 + 4 = 128
    std::string atLimit = std::string(64, 'a') + "@" + std::string(59, 'b') + ".com";
    ASSERT_EQ(atLimit.length(), 128u);
    EXPECT_NO_THROW(Email::of(atLimit));

    std::string overLimit = std::string(64, 'a') + "@" + std::string(60, 'b') + ".com";
    ASSERT_EQ(overLimit.length(), 129u);
    auto e = captureError([&overLimit] { Email::of(overLimit); });
    EXPECT_EQ(e.getKind(), ErrorKind::TOO_LONG);
}

// ============================================================================
// PasswordHash
// ============================================================================

TEST(PasswordHashTest, Of_LowercasesUppercaseHex) {
    auto hash = PasswordHash::of(repeat("0123456789ABCDEF", 8));
    EXPECT_EQ(hash.getValue(), validHash());
}

TEST(PasswordHashTest, Of_Empty) {
    auto e = captureError([] { PasswordHash::of("   "); });
    EXPECT_EQ(e.getKind(), ErrorKind::EMPTY_OR_UNSAFE);
}

TEST(PasswordHashTest, Of_NonHex) {
    std::string bad = validHash();
    bad[10] = 'z';
    auto e = captureError([&bad] { PasswordHash::of(bad); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_FORMAT);
}

TEST(PasswordHashTest, Of_WrongLength) {
    auto shortErr = captureError([] { PasswordHash::of(std::string(127, 'a')); });
    auto longErr = captureError([] { PasswordHash::of(std::string(129, 'a')); });
    EXPECT_EQ(shortErr.getKind(), ErrorKind::WRONG_LENGTH);
    EXPECT_EQ(longErr.getKind(), ErrorKind::WRONG_LENGTH);
    EXPECT_EQ(longErr.getCategory(), ErrorCategory::OUT_OF_RANGE);
}

// ============================================================================
// PasswordSalt
// ============================================================================

TEST(PasswordSaltTest, Of_Valid) {
    EXPECT_EQ(PasswordSalt::of(" " + validSalt() + " ").getValue(), validSalt());
}

TEST(PasswordSaltTest, Of_Empty) {
    auto e = captureError([] { PasswordSalt::of(""); });
    EXPECT_EQ(e.getKind(), ErrorKind::EMPTY_OR_UNSAFE);
}

TEST(PasswordSaltTest, Of_NonHex) {
    auto e = captureError([] { PasswordSalt::of(std::string(64, 'x')); });
    EXPECT_EQ(e.getKind(), ErrorKind::INVALID_FORMAT);
}

TEST(PasswordSaltTest, Of_WrongLength) {
    EXPECT_EQ(captureError([] { PasswordSalt::of(std::string(63, 'a')); }).getKind(),
              ErrorKind::WRONG_LENGTH);
    EXPECT_EQ(captureError([] { PasswordSalt::of(std::string(65, 'a')); }).getKind(),
              ErrorKind::WRONG_LENGTH);
    EXPECT_EQ(captureError([] { PasswordSalt::of(validHash()); }).getKind(),
              ErrorKind::WRONG_LENGTH);
}

// ============================================================================
// Phone
// ============================================================================

TEST(PhoneTest, Of_Valid) {
    EXPECT_EQ(Phone::of(" +1 505 555 0100 ").getValue(), "+1 505 555 0100");
}

TEST(PhoneTest, Of_EmptyOrUnsafe) {
    EXPECT_EQ(captureError([] { Phone::of(""); }).getKind(), ErrorKind::EMPTY_OR_UNSAFE);
    EXPECT_EQ(captureError([] { Phone::of("<tel>"); }).getKind(), ErrorKind::EMPTY_OR_UNSAFE);
}

TEST(PhoneTest, Of_TooLong) {
    EXPECT_NO_THROW(Phone::of(std::string(32, '5')));
    EXPECT_EQ(captureError([] { Phone::of(std::string(33, '5')); }).getKind(),
              ErrorKind::TOO_LONG);
}
