#pragma once
#include "SecretBackend.hpp"

#include <chrono>
#include <memory>
#include <string>

class BiometricGate;

// Account passwords in an OS-protected store, released only after a
// biometric check when the device supports one.
//
// The gate applies to retrieval only. Stores reject an access policy attached
// at write time from an unentitled process, so storePassword() is gate-free.
class CredentialStore {
public:
    CredentialStore(std::shared_ptr<SecretBackend> backend,
                    std::shared_ptr<BiometricGate> gate,
                    std::chrono::milliseconds biometricTimeout = std::chrono::milliseconds::zero());

    // Replaces any existing entry (delete, then add).
    void storePassword(const std::string& account, const std::string& password);

    // Throws CredentialsNotFound, BiometricDenied/Timeout or StoreFailure.
    std::string getPassword(const std::string& account,
                            const std::string& prompt = "Authenticate to access credentials");

    // Idempotent. Returns true if an entry was actually removed.
    bool deletePassword(const std::string& account);

    // Never prompts.
    bool hasPassword(const std::string& account);

    SecretBackend& backend() { return *backend_; }

private:
    std::shared_ptr<SecretBackend> backend_;
    std::shared_ptr<BiometricGate> gate_;
    std::chrono::milliseconds biometricTimeout_;
};

// Builds the backend named by the secret_backend setting.
std::shared_ptr<SecretBackend> makeSecretBackend(const std::string& name,
                                                 const std::string& vaultDir);
