#pragma once
#include <filesystem>
#include <memory>
#include <string>

struct LoginResult {
    bool requiresTwoFactor = false;
};

// Client for the remote account service. The wire protocol lives behind
// this interface.
//
// login() throws HideMailError with AuthenticationRejected for bad
// credentials and NetworkError when the transport fails.
class RemoteAccount {
public:
    virtual ~RemoteAccount() = default;

    virtual LoginResult login(const std::string& account, const std::string& secret) = 0;
    virtual bool validateTwoFactorCode(const std::string& code) = 0;
    virtual bool isTrustedSession() = 0;
    virtual void trustSession() = 0;

    // Called once the session state has been moved to its final location.
    virtual void rebindSession(const std::filesystem::path& /*location*/) {}
};

class RemoteAccountFactory {
public:
    virtual ~RemoteAccountFactory() = default;

    // The client keeps its session state (cookies) under sessionLocation.
    virtual std::unique_ptr<RemoteAccount> open(const std::string& account,
                                                const std::filesystem::path& sessionLocation) = 0;
};

// Authenticated client handed to alias operations.
class SessionHandle {
public:
    SessionHandle(std::string account, std::shared_ptr<RemoteAccount> remote)
        : account_(std::move(account)), remote_(std::move(remote)) {}

    const std::string& account() const { return account_; }
    RemoteAccount& remote() const { return *remote_; }

private:
    std::string account_;
    std::shared_ptr<RemoteAccount> remote_;
};
