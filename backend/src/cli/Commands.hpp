#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../config/Paths.hpp"
#include "../config/Settings.hpp"

class AuthSessionManager;
class Credential;
class BiometricGate;
class CredentialStore;
class SessionCache;

// Everything a command needs, wired from the user's settings.
struct App {
    Paths paths;
    Settings settings;
    std::shared_ptr<BiometricGate> gate;
    std::shared_ptr<CredentialStore> store;
    std::shared_ptr<SessionCache> sessions;
    std::shared_ptr<AuthSessionManager> auth;

    static App create(const Paths& paths);
};

int runSetup(App& app);
// Non-interactive tail of setup: store, set default, authenticate. A failed
// first login removes the credential, the session and the default account.
int completeSetup(App& app, const Credential& credential, std::function<std::string()> twoFactor);
int runLogin(App& app, const std::optional<std::string>& username);
int runLogout(App& app, const std::optional<std::string>& username, bool assumeYes);
int runStatus(App& app);
