#include "HelperProcessAccount.hpp"
#include "../core/Credential.hpp"
#include "../core/Errors.hpp"
#include "../utils/Process.hpp"

#include <system_error>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitRejected = 2;
constexpr int kExitNetwork = 3;

std::string detailOf(const ProcessResult& res) {
    std::string d = res.err;
    while (!d.empty() && (d.back() == '\n' || d.back() == '\r')) d.pop_back();
    return d;
}

}  // namespace

HelperProcessAccount::HelperProcessAccount(std::string helper, std::string account,
                                           std::filesystem::path sessionDir)
    : helper_(std::move(helper)), account_(std::move(account)), sessionDir_(std::move(sessionDir))
{
}

std::vector<std::string> HelperProcessAccount::command(const std::string& op) const {
    return {helper_, op, "--account", account_, "--session-dir", sessionDir_.string()};
}

static ProcessResult invoke(const std::vector<std::string>& argv, const std::string& input = "") {
    ProcessResult res;
    try {
        res = runProcess(argv, input);
    }
    catch (const std::system_error& e) {
        spdlog::error("Cannot run remote helper '{}': {}", argv.front(), e.what());
        throw HideMailError(ErrorKind::Unexpected,
                            "Remote helper '" + argv.front() + "' could not be started: " + e.what() +
                                ". Install it or point remote_helper in the config file at it.");
    }

    if (res.exitCode == kExitNetwork) {
        auto detail = detailOf(res);
        spdlog::error("Remote helper '{}' reported a network failure: {}", argv[1], detail);
        throw HideMailError(ErrorKind::NetworkError,
                            detail.empty() ? "Network request failed" : detail);
    }
    return res;
}

LoginResult HelperProcessAccount::login(const std::string& account, const std::string& secret) {
    account_ = account;
    spdlog::info("Remote login for '{}'", account_);

    std::string input = secret + "\n";
    ProcessResult res;
    try {
        res = invoke(command("login"), input);
    }
    catch (const HideMailError&) {
        wipe(input);
        throw;
    }
    wipe(input);

    if (res.exitCode == kExitRejected) {
        auto detail = detailOf(res);
        spdlog::warn("Remote login rejected for '{}': {}", account_, detail);
        throw HideMailError(ErrorKind::AuthenticationRejected,
                            "Login failed: " + (detail.empty() ? std::string("invalid credentials") : detail));
    }
    if (res.exitCode != 0) {
        throw HideMailError(ErrorKind::Unexpected,
                            "Remote helper login exited with " + std::to_string(res.exitCode) +
                                (res.err.empty() ? "" : ": " + detailOf(res)));
    }

    LoginResult result;
    result.requiresTwoFactor = res.out.find("2fa-required") != std::string::npos;
    spdlog::info("Remote login for '{}' accepted{}", account_,
                 result.requiresTwoFactor ? " (two-factor required)" : "");
    return result;
}

bool HelperProcessAccount::validateTwoFactorCode(const std::string& code) {
    std::string input = code + "\n";
    ProcessResult res;
    try {
        res = invoke(command("validate-2fa"), input);
    }
    catch (const HideMailError&) {
        wipe(input);
        throw;
    }
    wipe(input);
    if (res.exitCode == 0) return true;
    if (res.exitCode == 1) {
        spdlog::warn("Two-factor code rejected for '{}'", account_);
        return false;
    }
    throw HideMailError(ErrorKind::Unexpected,
                        "Remote helper validate-2fa exited with " + std::to_string(res.exitCode));
}

bool HelperProcessAccount::isTrustedSession() {
    auto res = invoke(command("trust-status"));
    if (res.exitCode == 0 || res.exitCode == 1) return res.exitCode == 0;
    throw HideMailError(ErrorKind::Unexpected,
                        "Remote helper trust-status exited with " + std::to_string(res.exitCode));
}

void HelperProcessAccount::trustSession() {
    auto res = invoke(command("trust"));
    if (res.exitCode != 0) {
        throw HideMailError(ErrorKind::Unexpected,
                            "Remote helper trust exited with " + std::to_string(res.exitCode) +
                                (res.err.empty() ? "" : ": " + detailOf(res)));
    }
    spdlog::info("Session trusted for '{}'", account_);
}

std::unique_ptr<RemoteAccount> HelperProcessAccountFactory::open(const std::string& account,
                                                                const std::filesystem::path& sessionLocation) {
    return std::make_unique<HelperProcessAccount>(helper_, account, sessionLocation);
}
