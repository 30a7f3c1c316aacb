#pragma once
#include "SecretBackend.hpp"

#include <string>

// macOS login keychain through /usr/bin/security generic-password items.
//
// The native Security API is not used: adding items with an access policy
// from an unsigned binary fails with errSecMissingEntitlement (-34018).
class SecurityCliBackend : public SecretBackend {
public:
    explicit SecurityCliBackend(std::string tool = "/usr/bin/security");

    void add(const std::string& account, const std::string& secret) override;
    std::optional<std::string> find(const std::string& account) override;
    bool remove(const std::string& account) override;
    bool exists(const std::string& account) override;

    const char* name() const override { return "security"; }

private:
    std::string tool_;
};
