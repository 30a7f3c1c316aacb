#include "CredentialStore.hpp"
#include "EncryptedFileBackend.hpp"
#include "SecretToolBackend.hpp"
#include "SecurityCliBackend.hpp"
#include "../auth/BiometricGate.hpp"
#include "../core/Errors.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

CredentialStore::CredentialStore(std::shared_ptr<SecretBackend> backend,
                                 std::shared_ptr<BiometricGate> gate,
                                 std::chrono::milliseconds biometricTimeout)
    : backend_(std::move(backend)), gate_(std::move(gate)), biometricTimeout_(biometricTimeout)
{
    if (!backend_) throw std::invalid_argument("CredentialStore: backend is required");
    spdlog::debug("CredentialStore using '{}' backend", backend_->name());
}

void CredentialStore::storePassword(const std::string& account, const std::string& password) {
    spdlog::info("Storing credentials for '{}'", account);

    if (account.empty())
        throw storeError(SecStatus::InvalidParameter, "account must not be empty");

    // A missing entry is fine; anything else would make add() collide
    try {
        backend_->remove(account);
    }
    catch (const HideMailError& e) {
        spdlog::debug("Pre-store delete for '{}' failed: {}", account, e.what());
    }

    backend_->add(account, password);
    spdlog::info("Credentials stored for '{}'", account);
}

std::string CredentialStore::getPassword(const std::string& account, const std::string& prompt) {
    spdlog::debug("Credential lookup for '{}'", account);

    if (gate_ && gate_->isAvailable()) {
        try {
            gate_->verify(prompt, biometricTimeout_);
        }
        catch (const HideMailError& e) {
            spdlog::warn("Credential release for '{}' refused: {}", account, e.what());
            throw;
        }
    }

    auto secret = backend_->find(account);
    if (!secret) {
        spdlog::info("No credentials on file for '{}'", account);
        throw HideMailError(ErrorKind::CredentialsNotFound,
                            "No credentials found for this account", SecStatus::ItemNotFound);
    }
    return std::move(*secret);
}

bool CredentialStore::deletePassword(const std::string& account) {
    bool removed = backend_->remove(account);
    if (removed)
        spdlog::info("Deleted credentials for '{}'", account);
    else
        spdlog::debug("No credentials to delete for '{}'", account);
    return removed;
}

bool CredentialStore::hasPassword(const std::string& account) {
    try {
        return backend_->exists(account);
    }
    catch (const std::exception& e) {
        spdlog::warn("Existence check for '{}' failed: {}", account, e.what());
        return false;
    }
}

std::shared_ptr<SecretBackend> makeSecretBackend(const std::string& name, const std::string& vaultDir) {
    if (name == "secret-tool") return std::make_shared<SecretToolBackend>();
    if (name == "security") return std::make_shared<SecurityCliBackend>();
    if (name == "file") return std::make_shared<EncryptedFileBackend>(vaultDir);
    throw std::invalid_argument("Unknown secret_backend '" + name + "'");
}
