#include "EncryptedFileBackend.hpp"
#include "../core/Credential.hpp"
#include "../core/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <unistd.h>

#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char MAGIC_HDR[] = "HMVAULT1\n";

EncryptedFileBackend::EncryptedFileBackend(fs::path dir)
    : dir_(std::move(dir))
{
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        throw storeError(SecStatus::Unimplemented, "libsodium initialization failed");
    }
}

EncryptedFileBackend::~EncryptedFileBackend() {
    if (!key_.empty())
        sodium_memzero(key_.data(), key_.size());
}

fs::path EncryptedFileBackend::itemPath(const std::string& account) const {
    std::string material = std::string(kServiceName) + '\0' + account;

    unsigned char digest[crypto_generichash_BYTES];
    crypto_generichash(digest, sizeof(digest),
                       reinterpret_cast<const unsigned char*>(material.data()), material.size(),
                       nullptr, 0);

    char hex[2 * sizeof(digest) + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    return dir_ / (std::string(hex) + ".item");
}

const std::vector<unsigned char>& EncryptedFileBackend::loadKey(bool create) {
    if (!key_.empty()) return key_;

    std::ifstream in(keyPath(), std::ios::binary);
    if (in) {
        std::vector<unsigned char> key((std::istreambuf_iterator<char>(in)),
                                       std::istreambuf_iterator<char>());
        if (key.size() != crypto_secretbox_KEYBYTES) {
            sodium_memzero(key.data(), key.size());
            spdlog::error("Vault key '{}' has invalid size", keyPath().string());
            throw storeError(SecStatus::InvalidData, "vault key file is corrupt");
        }
        key_ = std::move(key);
        return key_;
    }

    if (!create) return key_;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("Failed to create vault directory '{}': {}", dir_.string(), ec.message());
        throw storeError(SecStatus::NoSuchKeychain, "cannot create " + dir_.string());
    }
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);

    key_.resize(crypto_secretbox_KEYBYTES);
    crypto_secretbox_keygen(key_.data());

    int fd = ::open(keyPath().c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        int err = errno;
        sodium_memzero(key_.data(), key_.size());
        key_.clear();
        spdlog::error("Failed to create vault key '{}': {}", keyPath().string(), std::strerror(err));
        throw storeError(SecStatus::NoSuchKeychain, "cannot create vault key: " + std::string(std::strerror(err)));
    }
    ssize_t w = ::write(fd, key_.data(), key_.size());
    ::close(fd);
    if (w != static_cast<ssize_t>(key_.size())) {
        sodium_memzero(key_.data(), key_.size());
        key_.clear();
        fs::remove(keyPath(), ec);
        throw storeError(SecStatus::NoSuchKeychain, "short write on vault key");
    }

    spdlog::info("Created new vault key at '{}'", keyPath().string());
    return key_;
}

void EncryptedFileBackend::add(const std::string& account, const std::string& secret) {
    const auto& key = loadKey(true);

    std::string plain = account + '\0' + secret;
    std::vector<unsigned char> ciphertext(plain.size() + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(),
                                   reinterpret_cast<const unsigned char*>(plain.data()), plain.size(),
                                   nonce, key.data());
    wipe(plain);
    if (rc != 0) {
        spdlog::error("Encryption failed for '{}'", account);
        throw storeError(SecStatus::InvalidData, "encryption failed");
    }

    auto target = itemPath(account);
    auto tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp.string());
            throw storeError(SecStatus::NoSuchKeychain, "cannot write " + tmp.string());
        }
        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) throw storeError(SecStatus::NoSuchKeychain, "short write on " + tmp.string());
    }

    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw storeError(SecStatus::NoSuchKeychain, "cannot replace " + target.string());
    }
    spdlog::debug("Stored encrypted item for '{}'", account);
}

std::optional<std::string> EncryptedFileBackend::find(const std::string& account) {
    std::ifstream in(itemPath(account), std::ios::binary);
    if (!in) {
        spdlog::debug("No vault item for '{}'", account);
        return std::nullopt;
    }

    const auto& key = loadKey(false);
    if (key.empty()) {
        spdlog::error("Vault item for '{}' exists but the key is missing", account);
        throw storeError(SecStatus::NoDefaultKeychain, "vault key is missing");
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in vault item for '{}'", account);
        throw storeError(SecStatus::InvalidData, "vault item has an invalid header");
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        throw storeError(SecStatus::InvalidData, "vault item is truncated");
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        throw storeError(SecStatus::InvalidData, "vault item is truncated");
    }

    std::string plain(ciphertext.size() - crypto_secretbox_MACBYTES, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(&plain[0]),
                                   ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed for '{}'", account);
        throw storeError(SecStatus::InvalidData, "vault item failed authentication");
    }

    auto sep = plain.find('\0');
    if (sep == std::string::npos || plain.compare(0, sep, account) != 0) {
        wipe(plain);
        spdlog::error("Vault item does not belong to '{}'", account);
        throw storeError(SecStatus::InvalidData, "vault item belongs to another account");
    }

    std::string secret = plain.substr(sep + 1);
    wipe(plain);
    return secret;
}

bool EncryptedFileBackend::remove(const std::string& account) {
    std::error_code ec;
    bool removed = fs::remove(itemPath(account), ec);
    if (ec) {
        spdlog::error("Failed to remove vault item for '{}': {}", account, ec.message());
        throw storeError(SecStatus::AuthorizationDenied, ec.message());
    }
    return removed;
}

bool EncryptedFileBackend::exists(const std::string& account) {
    std::error_code ec;
    return fs::is_regular_file(itemPath(account), ec);
}
