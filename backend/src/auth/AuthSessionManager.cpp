#include "AuthSessionManager.hpp"
#include "../core/Credential.hpp"
#include "../storage/CredentialStore.hpp"
#include "../storage/SessionCache.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

static const char* kCredentialPrompt = "Authenticate to access iCloud credentials";
static const char* kValidityPrompt = "Check iCloud session";

const char* stateName(AuthState state) {
    switch (state) {
    case AuthState::Unauthenticated:     return "Unauthenticated";
    case AuthState::ResolvingCredential: return "ResolvingCredential";
    case AuthState::AttemptingLogin:     return "AttemptingLogin";
    case AuthState::AwaitingTwoFactor:   return "AwaitingTwoFactor";
    case AuthState::Trusting:            return "Trusting";
    case AuthState::Authenticated:       return "Authenticated";
    case AuthState::Failed:              return "Failed";
    }
    return "Unknown";
}

AuthSessionManager::AuthSessionManager(std::shared_ptr<CredentialStore> store,
                                       std::shared_ptr<SessionCache> cache,
                                       std::shared_ptr<RemoteAccountFactory> remotes)
    : store_(std::move(store)), cache_(std::move(cache)), remotes_(std::move(remotes))
{
    if (!store_ || !cache_ || !remotes_)
        throw std::invalid_argument("AuthSessionManager: store, cache and remote factory are required");
    spdlog::info("AuthSessionManager initialized with session root '{}'", cache_->root().string());
}

void AuthSessionManager::transition(const std::string& account, AuthState next) {
    spdlog::debug("Auth '{}': {} -> {}", account, stateName(state_), stateName(next));
    state_ = next;
}

void AuthSessionManager::fail(const std::string& account, const HideMailError& error) {
    spdlog::warn("Authentication for '{}' failed in state {}: [{}] {}",
                 account, stateName(state_), kindName(error.kind()), error.what());
    state_ = AuthState::Failed;
    lastFailure_ = error.kind();
    throw error;
}

std::string AuthSessionManager::resolvePassword(const std::string& account) {
    transition(account, AuthState::ResolvingCredential);
    try {
        return store_->getPassword(account, kCredentialPrompt);
    }
    catch (const HideMailError& e) {
        switch (e.kind()) {
        case ErrorKind::CredentialsNotFound:
            fail(account, HideMailError(ErrorKind::CredentialsNotFound,
                                        "No stored credentials found. Run 'hidemail setup' first.",
                                        e.statusCode()));
        case ErrorKind::BiometricDenied:
        case ErrorKind::BiometricTimeout:
            fail(account, HideMailError(ErrorKind::CredentialsNotFound,
                                        std::string("Stored credentials were not released: ") + e.what(),
                                        e.statusCode()));
        default:
            fail(account, e);
        }
    }
}

SessionHandle AuthSessionManager::authenticate(const std::string& account,
                                               std::optional<std::string> password,
                                               TwoFactorProvider twoFactor) {
    spdlog::info("Authentication requested for '{}'", account);
    state_ = AuthState::Unauthenticated;
    lastFailure_.reset();

    if (!SessionCache::isValidAccount(account)) {
        if (password) wipe(*password);
        fail(account, HideMailError(ErrorKind::Unexpected,
                                    "Invalid account name '" + account + "'",
                                    SecStatus::InvalidParameter));
    }

    Credential credential(account, password ? std::move(*password) : std::string());
    if (password) wipe(*password);
    else credential.secret = resolvePassword(account);

    transition(account, AuthState::AttemptingLogin);

    std::shared_ptr<RemoteAccount> remote;
    try {
        auto staging = cache_->beginStaging(account);
        remote = remotes_->open(account, staging);

        LoginResult login = remote->login(credential.account, credential.secret);

        if (login.requiresTwoFactor) {
            transition(account, AuthState::AwaitingTwoFactor);
            if (!twoFactor) {
                throw HideMailError(ErrorKind::TwoFactorRequired,
                                    "Two-factor authentication required but no code provider was supplied");
            }

            std::string code = twoFactor();
            bool valid = remote->validateTwoFactorCode(code);
            wipe(code);
            if (!valid)
                throw HideMailError(ErrorKind::AuthenticationRejected, "Invalid 2FA code");

            transition(account, AuthState::Trusting);
            // Trusting the session keeps later logins from asking for a code again
            if (!remote->isTrustedSession()) {
                spdlog::info("Requesting session trust for '{}'", account);
                remote->trustSession();
            }
        }

        cache_->commit(account);
        remote->rebindSession(cache_->pathFor(account));
    }
    catch (const HideMailError& e) {
        cache_->discardStaging(account);
        fail(account, e);
    }
    catch (const std::exception& e) {
        cache_->discardStaging(account);
        fail(account, HideMailError(ErrorKind::Unexpected, e.what()));
    }

    transition(account, AuthState::Authenticated);
    spdlog::info("Account '{}' authenticated successfully", account);
    return SessionHandle(account, remote);
}

bool AuthSessionManager::isSessionValid(const std::string& account) {
    spdlog::debug("Checking session validity for '{}'", account);
    try {
        if (!store_->hasPassword(account)) {
            spdlog::debug("No stored credentials for '{}'", account);
            return false;
        }
        if (!cache_->exists(account)) {
            spdlog::debug("No session artifact for '{}'", account);
            return false;
        }

        Credential credential(account, store_->getPassword(account, kValidityPrompt));
        auto remote = remotes_->open(account, cache_->pathFor(account));
        bool valid = !remote->login(credential.account, credential.secret).requiresTwoFactor;

        spdlog::info("Session for '{}' is {}", account, valid ? "valid" : "expired (two-factor required)");
        return valid;
    }
    catch (const std::exception& e) {
        spdlog::info("Session check for '{}' failed: {}", account, e.what());
        return false;
    }
}

void AuthSessionManager::clearSession(const std::string& account) {
    spdlog::info("Clearing session for '{}'", account);
    cache_->clear(account);
    cache_->discardStaging(account);
    state_ = AuthState::Unauthenticated;
    lastFailure_.reset();
}
