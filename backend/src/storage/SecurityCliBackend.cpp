#include "SecurityCliBackend.hpp"
#include "../core/Credential.hpp"
#include "../core/Errors.hpp"
#include "../utils/Process.hpp"

#include <system_error>
#include <spdlog/spdlog.h>

namespace {

// security(1) exits with 44 when no matching item exists
constexpr int kExitItemNotFound = 44;

bool notFound(const ProcessResult& res) {
    return res.exitCode == kExitItemNotFound ||
           res.err.find("could not be found") != std::string::npos;
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    return s;
}

ProcessResult runTool(const std::vector<std::string>& argv) {
    try {
        return runProcess(argv);
    }
    catch (const std::system_error& e) {
        spdlog::error("Cannot run '{}': {}", argv.front(), e.what());
        throw storeError(SecStatus::Unimplemented, argv.front() + " command not found");
    }
}

HideMailError commandFailed(const std::string& op, const ProcessResult& res) {
    auto detail = trimmed(res.err);
    if (detail.empty())
        detail = "security command failed with code " + std::to_string(res.exitCode);
    else
        detail = "security command failed: " + detail;
    spdlog::error("security {} failed (exit {})", op, res.exitCode);
    return storeError(res.exitCode, detail);
}

}  // namespace

SecurityCliBackend::SecurityCliBackend(std::string tool)
    : tool_(std::move(tool))
{
}

void SecurityCliBackend::add(const std::string& account, const std::string& secret) {
    spdlog::debug("security: adding generic password for '{}'", account);
    auto res = runTool({tool_, "add-generic-password", "-s", kServiceName, "-a", account,
                        "-w", secret, "-U"});
    if (res.exitCode != 0)
        throw commandFailed("add-generic-password", res);
}

std::optional<std::string> SecurityCliBackend::find(const std::string& account) {
    auto res = runTool({tool_, "find-generic-password", "-s", kServiceName, "-a", account, "-w"});
    if (res.exitCode == 0) {
        std::string secret = trimmed(res.out);
        wipe(res.out);
        return secret;
    }
    if (notFound(res)) {
        spdlog::debug("security: no item for '{}'", account);
        return std::nullopt;
    }
    throw commandFailed("find-generic-password", res);
}

bool SecurityCliBackend::remove(const std::string& account) {
    auto res = runTool({tool_, "delete-generic-password", "-s", kServiceName, "-a", account});
    if (res.exitCode == 0) return true;
    if (notFound(res)) return false;
    throw commandFailed("delete-generic-password", res);
}

bool SecurityCliBackend::exists(const std::string& account) {
    // Without -w the secret is not printed
    try {
        auto res = runProcess({tool_, "find-generic-password", "-s", kServiceName, "-a", account});
        return res.exitCode == 0;
    }
    catch (const std::system_error& e) {
        spdlog::warn("Cannot run '{}': {}", tool_, e.what());
        return false;
    }
}
