#include "SecretToolBackend.hpp"
#include "../core/Credential.hpp"
#include "../core/Errors.hpp"
#include "../utils/Process.hpp"

#include <system_error>
#include <spdlog/spdlog.h>

namespace {

// secret-tool only reports failures as text on stderr.
int statusFromStderr(const std::string& err, int exitCode) {
    if (err.find("Cannot autolaunch D-Bus") != std::string::npos ||
        err.find("org.freedesktop.secrets") != std::string::npos ||
        err.find("No such secret collection") != std::string::npos)
        return SecStatus::NoDefaultKeychain;
    if (err.find("dismissed") != std::string::npos ||
        err.find("canceled") != std::string::npos ||
        err.find("cancelled") != std::string::npos)
        return SecStatus::AuthCanceled;
    if (err.find("locked") != std::string::npos)
        return SecStatus::InteractionNotAllowed;
    if (err.find("not allowed") != std::string::npos)
        return SecStatus::AuthorizationDenied;
    return exitCode;
}

std::string firstLine(const std::string& s) {
    auto nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

ProcessResult runTool(const std::vector<std::string>& argv, const std::string& input = "") {
    try {
        return runProcess(argv, input);
    }
    catch (const std::system_error& e) {
        spdlog::error("Cannot run '{}': {}", argv.front(), e.what());
        throw storeError(SecStatus::Unimplemented, argv.front() + " command not found");
    }
}

}  // namespace

SecretToolBackend::SecretToolBackend(std::string tool)
    : tool_(std::move(tool))
{
}

std::vector<std::string> SecretToolBackend::attributes(const std::string& account) const {
    return {"service", kServiceName, "account", account};
}

void SecretToolBackend::add(const std::string& account, const std::string& secret) {
    spdlog::debug("secret-tool: storing item for '{}'", account);

    std::vector<std::string> argv = {tool_, "store", "--label=Hide My Email (" + account + ")"};
    for (auto& a : attributes(account)) argv.push_back(a);

    auto res = runTool(argv, secret);
    if (res.exitCode != 0) {
        auto detail = firstLine(res.err);
        spdlog::error("secret-tool store failed for '{}' (exit {}): {}", account, res.exitCode, detail);
        throw storeError(statusFromStderr(res.err, res.exitCode),
                         detail.empty() ? "secret-tool store failed" : "secret-tool store failed: " + detail);
    }
}

std::optional<std::string> SecretToolBackend::find(const std::string& account) {
    std::vector<std::string> argv = {tool_, "lookup"};
    for (auto& a : attributes(account)) argv.push_back(a);

    auto res = runTool(argv);
    if (res.exitCode == 0) {
        std::string secret = res.out;
        wipe(res.out);
        if (!secret.empty() && secret.back() == '\n') secret.pop_back();
        return secret;
    }

    // lookup exits non-zero without diagnostics when nothing matches
    if (res.err.empty()) {
        spdlog::debug("secret-tool: no item for '{}'", account);
        return std::nullopt;
    }

    auto detail = firstLine(res.err);
    spdlog::error("secret-tool lookup failed for '{}' (exit {}): {}", account, res.exitCode, detail);
    throw storeError(statusFromStderr(res.err, res.exitCode), "secret-tool lookup failed: " + detail);
}

bool SecretToolBackend::remove(const std::string& account) {
    bool existed = exists(account);

    std::vector<std::string> argv = {tool_, "clear"};
    for (auto& a : attributes(account)) argv.push_back(a);

    auto res = runTool(argv);
    if (res.exitCode != 0 && !res.err.empty()) {
        auto detail = firstLine(res.err);
        spdlog::error("secret-tool clear failed for '{}' (exit {}): {}", account, res.exitCode, detail);
        throw storeError(statusFromStderr(res.err, res.exitCode), "secret-tool clear failed: " + detail);
    }
    return existed;
}

bool SecretToolBackend::exists(const std::string& account) {
    std::vector<std::string> argv = {tool_, "lookup"};
    for (auto& a : attributes(account)) argv.push_back(a);

    try {
        auto res = runProcess(argv);
        wipe(res.out);
        return res.exitCode == 0;
    }
    catch (const std::system_error& e) {
        spdlog::warn("Cannot run '{}': {}", tool_, e.what());
        return false;
    }
}
