#pragma once
#include "SecretBackend.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Secrets encrypted with libsodium secretbox, one file per account.
//
// Layout of <dir>/<blake2b(ns, account)>.item:
//   Header: 9 bytes ASCII "HMVAULT1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext of "<account>\0<secret>"
//
// The key lives in <dir>/vault.key (random, mode 0600) and is created on
// first write. Tampered or foreign files are reported as StoreFailure.
class EncryptedFileBackend : public SecretBackend {
public:
    explicit EncryptedFileBackend(std::filesystem::path dir);
    ~EncryptedFileBackend() override;

    void add(const std::string& account, const std::string& secret) override;
    std::optional<std::string> find(const std::string& account) override;
    bool remove(const std::string& account) override;
    bool exists(const std::string& account) override;

    const char* name() const override { return "file"; }

    std::filesystem::path itemPath(const std::string& account) const;
    std::filesystem::path keyPath() const { return dir_ / "vault.key"; }

private:
    std::filesystem::path dir_;
    std::vector<unsigned char> key_;

    const std::vector<unsigned char>& loadKey(bool create);
};
