#include "Commands.hpp"
#include "Prompt.hpp"
#include "../auth/AuthSessionManager.hpp"
#include "../auth/BiometricGate.hpp"
#include "../auth/FprintdPlatform.hpp"
#include "../auth/HelperProcessAccount.hpp"
#include "../core/Credential.hpp"
#include "../core/Errors.hpp"
#include "../storage/CredentialStore.hpp"
#include "../storage/SessionCache.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

namespace {

void printFailure(const HideMailError& e) {
    std::cout << "Error [" << kindName(e.kind()) << "]: " << e.what() << "\n"
              << "  " << remediation(e.kind()) << "\n";
}

std::string askTwoFactorCode() {
    return promptLine("Enter 2FA code from your device");
}

std::optional<std::string> accountOrDefault(App& app, const std::optional<std::string>& username) {
    if (username && !username->empty()) return username;
    return app.settings.defaultUsername();
}

}  // namespace

App App::create(const Paths& paths) {
    App app{paths, Settings::load(paths.configFile), nullptr, nullptr, nullptr, nullptr};

    std::shared_ptr<BiometricPlatform> platform;
    if (app.settings.biometricEnabled())
        platform = std::make_shared<FprintdPlatform>();
    else
        platform = std::make_shared<NullBiometricPlatform>();
    app.gate = std::make_shared<BiometricGate>(platform);

    auto backend = makeSecretBackend(app.settings.secretBackend(), paths.vaultDir.string());
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(app.settings.biometricTimeout());
    app.store = std::make_shared<CredentialStore>(backend, app.gate, timeout);

    app.sessions = std::make_shared<SessionCache>(paths.sessionDir);
    auto remotes = std::make_shared<HelperProcessAccountFactory>(app.settings.remoteHelper());
    app.auth = std::make_shared<AuthSessionManager>(app.store, app.sessions, remotes);
    return app;
}

int runSetup(App& app) {
    std::cout << "Hide My Email CLI Setup\n\n";

    if (app.gate->isAvailable()) {
        std::cout << "[ok] Fingerprint verification is available and will be used for authentication\n";
    }
    else {
        std::cout << "[!] Fingerprint verification not available. "
                     "Credentials will be stored without biometric protection.\n";
        if (!confirm("Continue without fingerprint protection?")) {
            std::cout << "Aborted.\n";
            return 1;
        }
    }

    Credential credential;
    credential.account = promptLine("Apple ID (email)");
    credential.secret = promptHidden("Password");
    if (credential.account.empty() || credential.secret.empty()) {
        std::cout << "Account and password are required.\n";
        return 1;
    }

    return completeSetup(app, credential, askTwoFactorCode);
}

int completeSetup(App& app, const Credential& credential, std::function<std::string()> twoFactor) {
    try {
        app.store->storePassword(credential.account, credential.secret);
    }
    catch (const HideMailError& e) {
        std::cout << "Failed to store credentials: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[ok] Credentials stored securely\n";

    if (app.settings.setDefaultUsername(credential.account))
        std::cout << "[ok] Set " << credential.account << " as default account\n";

    std::cout << "\nTesting authentication...\n";
    try {
        app.auth->authenticate(credential.account, credential.secret, std::move(twoFactor));
    }
    catch (const HideMailError& e) {
        printFailure(e);

        // Do not keep a password that never worked
        try {
            app.store->deletePassword(credential.account);
        }
        catch (const std::exception& cleanup) {
            spdlog::error("Removing credentials after failed setup for '{}' failed: {}",
                          credential.account, cleanup.what());
            std::cout << "Could not remove stored credentials: " << cleanup.what() << "\n";
        }
        try {
            app.auth->clearSession(credential.account);
        }
        catch (const std::exception& cleanup) {
            spdlog::error("Clearing session after failed setup for '{}' failed: {}",
                          credential.account, cleanup.what());
            std::cout << "Could not clear session data: " << cleanup.what() << "\n";
        }
        app.settings.clearDefaultUsername();
        return 1;
    }

    std::cout << "[ok] Successfully authenticated\n"
              << "\nSetup complete! Use 'hidemail status' to check your session.\n";
    return 0;
}

int runLogin(App& app, const std::optional<std::string>& username) {
    auto account = accountOrDefault(app, username);
    if (!account) {
        std::cout << "No account configured. Run 'hidemail setup' first.\n";
        return 1;
    }

    try {
        app.auth->authenticate(*account, std::nullopt, askTwoFactorCode);
    }
    catch (const HideMailError& e) {
        printFailure(e);
        return 1;
    }
    std::cout << "[ok] Authenticated as " << *account << "\n";
    return 0;
}

int runLogout(App& app, const std::optional<std::string>& username, bool assumeYes) {
    auto account = accountOrDefault(app, username);
    if (!account) {
        std::cout << "No account configured. Nothing to remove.\n";
        return 0;
    }

    if (!assumeYes && !confirm("Remove credentials for " + *account + "?")) {
        std::cout << "Aborted.\n";
        return 1;
    }

    try {
        if (app.store->deletePassword(*account))
            std::cout << "[ok] Removed credentials for " << *account << "\n";
        else
            std::cout << "No stored credentials found for " << *account << "\n";

        app.auth->clearSession(*account);
        std::cout << "[ok] Cleared session data\n";
    }
    catch (const HideMailError& e) {
        printFailure(e);
        return 1;
    }

    if (app.settings.defaultUsername() == account) {
        app.settings.clearDefaultUsername();
        std::cout << "[ok] Cleared default account\n";
    }
    return 0;
}

int runStatus(App& app) {
    auto account = app.settings.defaultUsername();
    if (!account) {
        std::cout << "No account configured.\n"
                  << "Run 'hidemail setup' to configure your Apple ID.\n";
        return 0;
    }

    std::cout << "Account:     " << *account << "\n";
    std::cout << "Credentials: "
              << (app.store->hasPassword(*account) ? "Stored" : "Not found") << "\n";
    std::cout << "Session:     "
              << (app.auth->isSessionValid(*account) ? "Valid" : "Expired or missing") << "\n";
    std::cout << "Fingerprint: "
              << (app.gate->isAvailable() ? "Available" : "Not available") << "\n";
    return 0;
}
