#include <gtest/gtest.h>

#include <set>
#include <string>

#include "core/Errors.hpp"

TEST(ErrorsTest, KnownStatusUsesTableMessage) {
    EXPECT_EQ("The specified item could not be found in the keychain (error -25295)",
              securityErrorMessage(SecStatus::ItemNotFound));
    EXPECT_EQ("A duplicate keychain item already exists (error -25294)",
              securityErrorMessage(SecStatus::DuplicateItem));
    EXPECT_EQ("Device passcode is not set (required for biometric protection) (error -67030)",
              securityErrorMessage(SecStatus::PasscodeNotSet));
}

TEST(ErrorsTest, UnknownStatusKeepsRawCode) {
    EXPECT_EQ("Unknown security error (error -12345)", securityErrorMessage(-12345));
    EXPECT_EQ("Unknown security error (error 44)", securityErrorMessage(44));
}

TEST(ErrorsTest, StoreErrorCarriesStatusAndDetail) {
    HideMailError e = storeError(SecStatus::InteractionNotAllowed, "keyring is locked");
    EXPECT_EQ(ErrorKind::StoreFailure, e.kind());
    ASSERT_TRUE(e.statusCode().has_value());
    EXPECT_EQ(SecStatus::InteractionNotAllowed, *e.statusCode());
    EXPECT_EQ("Keychain interaction is not allowed by the caller (error -25296): keyring is locked",
              std::string(e.what()));
}

TEST(ErrorsTest, PlainErrorHasNoStatus) {
    HideMailError e(ErrorKind::NetworkError, "connection reset");
    EXPECT_FALSE(e.statusCode().has_value());
    EXPECT_STREQ("connection reset", e.what());
}

TEST(ErrorsTest, EveryKindHasDistinctName) {
    const ErrorKind kinds[] = {
        ErrorKind::CredentialsNotFound, ErrorKind::AuthenticationRejected,
        ErrorKind::TwoFactorRequired, ErrorKind::StoreFailure,
        ErrorKind::BiometricDenied, ErrorKind::BiometricUnavailable,
        ErrorKind::BiometricTimeout, ErrorKind::NetworkError,
        ErrorKind::Unexpected,
    };
    std::set<std::string> names;
    for (ErrorKind kind : kinds) {
        names.insert(kindName(kind));
        EXPECT_STRNE("", remediation(kind));
    }
    EXPECT_EQ(sizeof(kinds) / sizeof(kinds[0]), names.size());
    EXPECT_STREQ("credentials-not-found", kindName(ErrorKind::CredentialsNotFound));
}
