#pragma once
#include <optional>
#include <stdexcept>
#include <string>

// Failure categories surfaced by the credential store and the session manager.
// Each kind maps to a distinct CLI message so callers can give targeted advice.
enum class ErrorKind {
    CredentialsNotFound,
    AuthenticationRejected,
    TwoFactorRequired,
    StoreFailure,
    BiometricDenied,
    BiometricUnavailable,
    BiometricTimeout,
    NetworkError,
    Unexpected
};

// Security framework status codes used by the store backends.
namespace SecStatus {
    constexpr int Success = 0;
    constexpr int Unimplemented = -4;
    constexpr int InvalidParameter = -50;
    constexpr int NoSuchKeychain = -25291;
    constexpr int DuplicateItem = -25294;
    constexpr int ItemNotFound = -25295;
    constexpr int InteractionNotAllowed = -25296;
    constexpr int AuthorizationDenied = -25298;
    constexpr int InvalidData = -25299;
    constexpr int NoDefaultKeychain = -25300;
    constexpr int AuthCanceled = -26275;
    constexpr int AuthFailed = -26276;
    constexpr int MissingEntitlement = -34018;
    constexpr int PasscodeNotSet = -67030;
}

class HideMailError : public std::runtime_error {
public:
    HideMailError(ErrorKind kind, const std::string& message,
                  std::optional<int> statusCode = std::nullopt);

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<int>& statusCode() const noexcept { return statusCode_; }

private:
    ErrorKind kind_;
    std::optional<int> statusCode_;
};

// StoreFailure carrying the table message for `status` plus backend detail text.
HideMailError storeError(int status, const std::string& detail = "");

// "<message> (error N)" for known codes, "Unknown security error (error N)" otherwise.
std::string securityErrorMessage(int status);

// Stable identifier, e.g. "credentials-not-found".
const char* kindName(ErrorKind kind);

// Short remediation hint shown by the CLI.
const char* remediation(ErrorKind kind);
