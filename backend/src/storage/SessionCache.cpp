#include "SessionCache.hpp"
#include "../core/Errors.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

void removeAll(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
        spdlog::error("Failed to remove '{}': {}", p.string(), ec.message());
        throw storeError(SecStatus::AuthorizationDenied, "cannot remove " + p.string() + ": " + ec.message());
    }
}

}  // namespace

SessionCache::SessionCache(fs::path root)
    : root_(std::move(root))
{
}

void SessionCache::checkAccount(const std::string& account) {
    if (!isValidAccount(account))
        throw std::invalid_argument("Invalid account name for session cache: '" + account + "'");
}

fs::path SessionCache::pathFor(const std::string& account) const {
    checkAccount(account);
    return root_ / account;
}

fs::path SessionCache::stagingPathFor(const std::string& account) const {
    checkAccount(account);
    return root_ / (".pending-" + account);
}

bool SessionCache::exists(const std::string& account) const {
    std::error_code ec;
    auto st = fs::symlink_status(pathFor(account), ec);
    if (ec) return false;
    return st.type() == fs::file_type::regular || st.type() == fs::file_type::directory;
}

fs::path SessionCache::beginStaging(const std::string& account) {
    auto staging = stagingPathFor(account);
    removeAll(staging);

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        spdlog::error("Failed to create session directory '{}': {}", root_.string(), ec.message());
        throw storeError(SecStatus::NoSuchKeychain, "cannot create " + root_.string());
    }
    fs::permissions(root_, fs::perms::owner_all, fs::perm_options::replace, ec);

    // The client resumes from the last committed cookies (trust tokens included)
    if (exists(account)) {
        fs::copy(pathFor(account), staging, fs::copy_options::recursive, ec);
        if (ec) {
            spdlog::error("Failed to seed staging for '{}': {}", account, ec.message());
            removeAll(staging);
            throw storeError(SecStatus::AuthorizationDenied, "cannot copy session artifact: " + ec.message());
        }
    }

    spdlog::debug("Staging session for '{}' at '{}'", account, staging.string());
    return staging;
}

void SessionCache::commit(const std::string& account) {
    auto staging = stagingPathFor(account);
    auto target = pathFor(account);

    removeAll(target);

    std::error_code ec;
    if (fs::exists(staging, ec)) {
        fs::rename(staging, target, ec);
    }
    else {
        fs::create_directories(target, ec);
    }
    if (ec) {
        spdlog::error("Failed to commit session for '{}': {}", account, ec.message());
        throw storeError(SecStatus::AuthorizationDenied, "cannot write session artifact: " + ec.message());
    }
    spdlog::info("Session artifact saved for '{}'", account);
}

bool SessionCache::isValidAccount(const std::string& account) {
    return !(account.empty() || account == "." || account == ".." ||
             account.find('/') != std::string::npos || account.find('\0') != std::string::npos ||
             account.rfind(".pending-", 0) == 0);
}

void SessionCache::discardStaging(const std::string& account) {
    if (!isValidAccount(account)) return;
    auto staging = stagingPathFor(account);
    std::error_code ec;
    fs::remove_all(staging, ec);
    if (ec)
        spdlog::warn("Failed to discard staged session '{}': {}", staging.string(), ec.message());
}

void SessionCache::clear(const std::string& account) {
    auto target = pathFor(account);
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(target, ec))) {
        spdlog::debug("No session artifact for '{}'", account);
        return;
    }
    removeAll(target);
    spdlog::info("Cleared session artifact for '{}'", account);
}
