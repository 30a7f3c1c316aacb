#pragma once
#include "RemoteAccount.hpp"

#include <string>
#include <vector>

// RemoteAccount backed by an external helper executable that speaks the
// account service's protocol:
//
//   <helper> login        --account A --session-dir D   stdin: password
//        exit 0, stdout "ok" | "2fa-required"; exit 2 rejected; exit 3 network
//   <helper> validate-2fa --account A --session-dir D   stdin: code
//        exit 0 valid; exit 1 invalid; exit 3 network
//   <helper> trust-status --account A --session-dir D   exit 0 trusted; exit 1 not
//   <helper> trust        --account A --session-dir D   exit 0
//
// Diagnostics go to stderr and are surfaced as the error detail.
class HelperProcessAccount : public RemoteAccount {
public:
    HelperProcessAccount(std::string helper, std::string account, std::filesystem::path sessionDir);

    LoginResult login(const std::string& account, const std::string& secret) override;
    bool validateTwoFactorCode(const std::string& code) override;
    bool isTrustedSession() override;
    void trustSession() override;
    void rebindSession(const std::filesystem::path& location) override { sessionDir_ = location; }

private:
    std::string helper_;
    std::string account_;
    std::filesystem::path sessionDir_;

    std::vector<std::string> command(const std::string& op) const;
};

class HelperProcessAccountFactory : public RemoteAccountFactory {
public:
    explicit HelperProcessAccountFactory(std::string helper) : helper_(std::move(helper)) {}

    std::unique_ptr<RemoteAccount> open(const std::string& account,
                                        const std::filesystem::path& sessionLocation) override;

private:
    std::string helper_;
};
