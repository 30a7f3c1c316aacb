#include "Settings.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                          (s.front() == '\'' && s.back() == '\'')))
        return s.substr(1, s.size() - 2);
    return s;
}

constexpr long kDefaultBiometricTimeout = 60;
constexpr long kMaxBiometricTimeout = 3600;

}  // namespace

Settings::Settings(std::filesystem::path file)
    : file_(std::move(file))
{
}

Settings Settings::load(const std::filesystem::path& file) {
    Settings settings(file);

    std::ifstream in(file);
    if (!in) {
        spdlog::debug("Config file '{}' not found; using defaults", file.string());
        return settings;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        auto t = trim(line);
        if (t.empty() || t.front() == '#') continue;

        auto eq = t.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Ignoring malformed config line {} in '{}'", lineNo, file.string());
            continue;
        }
        auto key = trim(t.substr(0, eq));
        auto value = stripQuotes(trim(t.substr(eq + 1)));
        if (key.empty()) continue;
        settings.values_[key] = value;
    }

    spdlog::debug("Loaded {} config entries from '{}'", settings.values_.size(), file.string());
    return settings;
}

bool Settings::save() const {
    std::error_code ec;
    if (file_.has_parent_path())
        std::filesystem::create_directories(file_.parent_path(), ec);

    std::ofstream out(file_, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing config", file_.string());
        return false;
    }
    for (const auto& kv : values_)
        out << kv.first << " = " << kv.second << "\n";

    spdlog::debug("Saved {} config entries to '{}'", values_.size(), file_.string());
    return static_cast<bool>(out);
}

std::optional<std::string> Settings::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::string Settings::get(const std::string& key, const std::string& fallback) const {
    auto v = get(key);
    return v ? *v : fallback;
}

void Settings::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void Settings::erase(const std::string& key) {
    values_.erase(key);
}

std::optional<std::string> Settings::defaultUsername() const {
    auto v = get("default_username");
    if (v && v->empty()) return std::nullopt;
    return v;
}

bool Settings::setDefaultUsername(const std::string& username) {
    spdlog::info("Setting default account to '{}'", username);
    set("default_username", username);
    return save();
}

bool Settings::clearDefaultUsername() {
    spdlog::info("Clearing default account");
    erase("default_username");
    return save();
}

std::string Settings::secretBackend() const {
#if defined(__APPLE__)
    return get("secret_backend", "security");
#else
    return get("secret_backend", "secret-tool");
#endif
}

bool Settings::biometricEnabled() const {
    return get("biometric", "fprintd") != "off";
}

std::chrono::seconds Settings::biometricTimeout() const {
    auto raw = get("biometric_timeout_seconds");
    if (!raw) return std::chrono::seconds(kDefaultBiometricTimeout);
    try {
        long v = std::stol(*raw);
        if (v < 0) throw std::out_of_range("negative");
        if (v > kMaxBiometricTimeout) {
            spdlog::warn("biometric_timeout_seconds {} too large; using {}", v, kMaxBiometricTimeout);
            v = kMaxBiometricTimeout;
        }
        return std::chrono::seconds(v);
    }
    catch (const std::exception&) {
        spdlog::warn("Invalid biometric_timeout_seconds '{}'; using {}", *raw, kDefaultBiometricTimeout);
        return std::chrono::seconds(kDefaultBiometricTimeout);
    }
}

std::string Settings::remoteHelper() const {
    return get("remote_helper", "hidemail-remote");
}

std::string Settings::logLevel() const {
    return get("log_level", "info");
}
