#pragma once
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "auth/BiometricGate.hpp"
#include "auth/RemoteAccount.hpp"
#include "core/Errors.hpp"
#include "storage/SecretBackend.hpp"

class MockRemoteAccount : public RemoteAccount {
public:
    MOCK_METHOD(LoginResult, login, (const std::string&, const std::string&), (override));
    MOCK_METHOD(bool, validateTwoFactorCode, (const std::string&), (override));
    MOCK_METHOD(bool, isTrustedSession, (), (override));
    MOCK_METHOD(void, trustSession, (), (override));
    MOCK_METHOD(void, rebindSession, (const std::filesystem::path&), (override));
};

class MockRemoteAccountFactory : public RemoteAccountFactory {
public:
    MOCK_METHOD(std::unique_ptr<RemoteAccount>, open,
                (const std::string&, const std::filesystem::path&), (override));
};

class MockBiometricPlatform : public BiometricPlatform {
public:
    MOCK_METHOD(bool, canEvaluate, (std::string&), (override));
    MOCK_METHOD(void, evaluate, (const std::string&, Reply), (override));
    MOCK_METHOD(void, cancel, (), (override));
};

// In-memory store that records how often secrets were read.
class FakeSecretBackend : public SecretBackend {
public:
    void add(const std::string& account, const std::string& secret) override {
        if (items.count(account))
            throw storeError(SecStatus::DuplicateItem);
        items[account] = secret;
    }
    std::optional<std::string> find(const std::string& account) override {
        ++findCalls;
        auto it = items.find(account);
        if (it == items.end()) return std::nullopt;
        return it->second;
    }
    bool remove(const std::string& account) override { return items.erase(account) > 0; }
    bool exists(const std::string& account) override { return items.count(account) > 0; }
    const char* name() const override { return "fake"; }

    std::map<std::string, std::string> items;
    int findCalls = 0;
};

// Platform that answers synchronously with a fixed verdict.
class ScriptedBiometricPlatform : public BiometricPlatform {
public:
    ScriptedBiometricPlatform(bool available, bool grant) : available_(available), grant_(grant) {}

    bool canEvaluate(std::string& why) override {
        ++probes;
        if (!available_) why = "no sensor";
        return available_;
    }
    void evaluate(const std::string& reason, Reply reply) override {
        lastReason = reason;
        ++evaluations;
        reply(grant_, grant_ ? "" : "fingerprint did not match");
    }
    void cancel() override {}

    int probes = 0;
    int evaluations = 0;
    std::string lastReason;

private:
    bool available_;
    bool grant_;
};

// Remote whose behaviour depends on the session directory it is bound to:
// a "trust" cookie there suppresses the two-factor challenge, like the real
// service does for a trusted client.
class CookieJarRemote : public RemoteAccount {
public:
    CookieJarRemote(std::filesystem::path dir, std::string secret, std::string code, int& trustCalls)
        : dir_(std::move(dir)), secret_(std::move(secret)), code_(std::move(code)), trustCalls_(trustCalls) {}

    LoginResult login(const std::string&, const std::string& secret) override {
        if (secret != secret_)
            throw HideMailError(ErrorKind::AuthenticationRejected, "Login failed: invalid password");
        std::filesystem::create_directories(dir_);
        LoginResult r;
        r.requiresTwoFactor = !isTrustedSession();
        return r;
    }
    bool validateTwoFactorCode(const std::string& code) override { return code == code_; }
    bool isTrustedSession() override { return std::filesystem::exists(dir_ / "trust"); }
    void trustSession() override {
        std::ofstream(dir_ / "trust") << "trusted";
        ++trustCalls_;
    }
    void rebindSession(const std::filesystem::path& location) override { dir_ = location; }

private:
    std::filesystem::path dir_;
    std::string secret_;
    std::string code_;
    int& trustCalls_;
};

class CookieJarRemoteFactory : public RemoteAccountFactory {
public:
    CookieJarRemoteFactory(std::string secret, std::string code)
        : secret_(std::move(secret)), code_(std::move(code)) {}

    std::unique_ptr<RemoteAccount> open(const std::string&,
                                        const std::filesystem::path& sessionLocation) override {
        ++opens;
        return std::make_unique<CookieJarRemote>(sessionLocation, secret_, code_, trustCalls);
    }

    int opens = 0;
    int trustCalls = 0;

private:
    std::string secret_;
    std::string code_;
};
