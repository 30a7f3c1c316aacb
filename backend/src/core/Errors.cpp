#include "Errors.hpp"

#include <unordered_map>

namespace {

const std::unordered_map<int, const char*>& statusTable() {
    static const std::unordered_map<int, const char*> table = {
        {0, "Success"},
        {-4, "Function or operation not implemented"},
        {-25291, "No keychain is available"},
        {-25292, "The specified keychain is not a valid keychain file"},
        {-25293, "The specified keychain could not be opened"},
        {-25294, "A duplicate keychain item already exists"},
        {-25295, "The specified item could not be found in the keychain"},
        {-25296, "Keychain interaction is not allowed by the caller"},
        {-25297, "The keychain interaction was blocked by the user"},
        {-25298, "The caller does not have access to the keychain item"},
        {-25299, "The specified data is invalid for keychain"},
        {-25300, "No default keychain exists"},
        {-25308, "Interaction with the Security Server is not allowed"},
        {-26275, "An authorization/authentication was canceled"},
        {-26276, "Authorization/Authentication failed"},
        {-34018, "A required entitlement is missing (code signing issue)"},
        {-50, "One or more parameters passed were not valid"},
        {-67030, "Device passcode is not set (required for biometric protection)"},
    };
    return table;
}

}  // namespace

HideMailError::HideMailError(ErrorKind kind, const std::string& message,
                             std::optional<int> statusCode)
    : std::runtime_error(message), kind_(kind), statusCode_(statusCode)
{
}

std::string securityErrorMessage(int status) {
    const auto& table = statusTable();
    auto it = table.find(status);
    if (it == table.end())
        return "Unknown security error (error " + std::to_string(status) + ")";
    return std::string(it->second) + " (error " + std::to_string(status) + ")";
}

HideMailError storeError(int status, const std::string& detail) {
    std::string msg = securityErrorMessage(status);
    if (!detail.empty()) msg += ": " + detail;
    return HideMailError(ErrorKind::StoreFailure, msg, status);
}

const char* kindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::CredentialsNotFound:    return "credentials-not-found";
    case ErrorKind::AuthenticationRejected: return "authentication-rejected";
    case ErrorKind::TwoFactorRequired:      return "two-factor-required";
    case ErrorKind::StoreFailure:           return "store-error";
    case ErrorKind::BiometricDenied:        return "biometric-denied";
    case ErrorKind::BiometricUnavailable:   return "biometric-unavailable";
    case ErrorKind::BiometricTimeout:       return "biometric-timeout";
    case ErrorKind::NetworkError:           return "network-error";
    case ErrorKind::Unexpected:             return "auth-error";
    }
    return "auth-error";
}

const char* remediation(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::CredentialsNotFound:
        return "Run 'hidemail setup' to store your credentials.";
    case ErrorKind::AuthenticationRejected:
        return "Check your password or two-factor code and try again.";
    case ErrorKind::TwoFactorRequired:
        return "Run the command interactively to enter a two-factor code.";
    case ErrorKind::StoreFailure:
        return "Check that the secret store is unlocked and reachable.";
    case ErrorKind::BiometricDenied:
        return "Retry the fingerprint check.";
    case ErrorKind::BiometricUnavailable:
        return "Check that a fingerprint is enrolled and the device passcode is set.";
    case ErrorKind::BiometricTimeout:
        return "The fingerprint prompt timed out; run the command again.";
    case ErrorKind::NetworkError:
        return "Check your network connection and retry.";
    case ErrorKind::Unexpected:
        break;
    }
    return "See the log file for details.";
}
