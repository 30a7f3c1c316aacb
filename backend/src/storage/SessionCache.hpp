#pragma once
#include <filesystem>
#include <string>

// Per-account session artifacts (cookie jars) under one root directory.
//
// Remote clients write into a staging location; the artifact only becomes
// visible under <root>/<account> once commit() is called after a confirmed
// login. Account names that are not a single path component are rejected
// with std::invalid_argument.
class SessionCache {
public:
    explicit SessionCache(std::filesystem::path root);

    std::filesystem::path pathFor(const std::string& account) const;
    std::filesystem::path stagingPathFor(const std::string& account) const;

    // Present and a regular file or directory.
    bool exists(const std::string& account) const;

    // Single path component, not "." or "..", not a staging name.
    static bool isValidAccount(const std::string& account);

    // Resets the staging location to a copy of the committed artifact (or
    // nothing) and returns it, ready for a remote client.
    std::filesystem::path beginStaging(const std::string& account);
    // Replaces the committed artifact with the staged one. Creates an empty
    // marker directory if the client left nothing behind.
    void commit(const std::string& account);
    // Never throws; invalid account names are ignored.
    void discardStaging(const std::string& account);

    // Removes the artifact, recursively if it is a directory. Idempotent.
    void clear(const std::string& account);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    static void checkAccount(const std::string& account);
};
