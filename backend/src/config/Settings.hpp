#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

// User preferences persisted as "key = value" lines.
//
//   default_username           account used when -u is not given
//   secret_backend             secret-tool | security | file
//   biometric                  fprintd | off
//   biometric_timeout_seconds  0 waits forever, capped at one hour
//   remote_helper              executable that talks to the account service
//                              (protocol in auth/HelperProcessAccount.hpp)
//   log_level                  spdlog level name
class Settings {
public:
    explicit Settings(std::filesystem::path file);

    // Missing or unreadable files yield an empty (default) configuration.
    static Settings load(const std::filesystem::path& file);
    bool save() const;

    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback) const;
    void set(const std::string& key, const std::string& value);
    void erase(const std::string& key);

    std::optional<std::string> defaultUsername() const;
    bool setDefaultUsername(const std::string& username);
    bool clearDefaultUsername();

    std::string secretBackend() const;
    bool biometricEnabled() const;
    std::chrono::seconds biometricTimeout() const;
    std::string remoteHelper() const;
    std::string logLevel() const;

    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    std::map<std::string, std::string> values_;
};
