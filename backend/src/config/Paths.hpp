#pragma once
#include <filesystem>

// On-disk layout of the per-user state directory.
struct Paths {
    std::filesystem::path root;          // $HIDEMAIL_HOME or ~/.hidemail
    std::filesystem::path configFile;    // root/config
    std::filesystem::path sessionDir;    // root/session (one artifact per account)
    std::filesystem::path vaultDir;      // root/vault (encrypted-file backend)
    std::filesystem::path logFile;       // root/hidemail.log

    static Paths under(const std::filesystem::path& root);
    static Paths resolve();

    // Creates root with owner-only permissions if missing.
    void ensureRoot() const;
};
