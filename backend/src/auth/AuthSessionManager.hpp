#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "RemoteAccount.hpp"
#include "../core/Errors.hpp"

class CredentialStore;
class SessionCache;

enum class AuthState {
    Unauthenticated,
    ResolvingCredential,
    AttemptingLogin,
    AwaitingTwoFactor,
    Trusting,
    Authenticated,
    Failed
};

const char* stateName(AuthState state);

// Coordinates the credential store, the session cache and the remote
// account service into a single login.
//
// Order within authenticate() is fixed: resolve the password, log in,
// handle two-factor, trust the session, persist the session artifact.
// Nothing is retried, and a failed attempt never removes stored credentials;
// cleanup after a failed first login is the caller's job.
class AuthSessionManager {
public:
    using TwoFactorProvider = std::function<std::string()>;

    AuthSessionManager(std::shared_ptr<CredentialStore> store,
                       std::shared_ptr<SessionCache> cache,
                       std::shared_ptr<RemoteAccountFactory> remotes);

    // Throws HideMailError: CredentialsNotFound, AuthenticationRejected,
    // TwoFactorRequired (no provider given), StoreFailure, NetworkError, or
    // Unexpected for anything else.
    SessionHandle authenticate(const std::string& account,
                               std::optional<std::string> password = std::nullopt,
                               TwoFactorProvider twoFactor = nullptr);

    // Needs stored credentials and a session artifact, then re-opens the
    // remote session and reports whether it logs in without a new two-factor
    // challenge. Never throws.
    bool isSessionValid(const std::string& account);

    // Removes the session artifact; stored credentials are left alone.
    void clearSession(const std::string& account);

    AuthState state() const { return state_; }
    std::optional<ErrorKind> lastFailure() const { return lastFailure_; }

private:
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<SessionCache> cache_;
    std::shared_ptr<RemoteAccountFactory> remotes_;

    AuthState state_ = AuthState::Unauthenticated;
    std::optional<ErrorKind> lastFailure_;

    void transition(const std::string& account, AuthState next);
    [[noreturn]] void fail(const std::string& account, const HideMailError& error);

    std::string resolvePassword(const std::string& account);
};
