#pragma once
#include <optional>
#include <string>

// Service namespace shared by every stored account.
constexpr const char* kServiceName = "com.hidemyemail.cli";

// OS-protected key/value storage for one secret per account.
//
// Implementations throw HideMailError(ErrorKind::StoreFailure) with a status
// code when the underlying store fails; "not found" is never an error here.
class SecretBackend {
public:
    virtual ~SecretBackend() = default;

    virtual void add(const std::string& account, const std::string& secret) = 0;
    virtual std::optional<std::string> find(const std::string& account) = 0;
    // Returns false if there was nothing to remove.
    virtual bool remove(const std::string& account) = 0;
    // Must not prompt the user or reveal the secret.
    virtual bool exists(const std::string& account) = 0;

    virtual const char* name() const = 0;
};
