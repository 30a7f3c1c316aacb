#include "FprintdPlatform.hpp"
#include "../utils/Process.hpp"

#include <cstdlib>
#include <iostream>
#include <system_error>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

static std::string currentUser() {
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_name)
        return pw->pw_name;
    if (const char* user = std::getenv("USER"))
        return user;
    return {};
}

FprintdPlatform::FprintdPlatform(std::string listTool, std::string verifyTool)
    : listTool_(std::move(listTool)), verifyTool_(std::move(verifyTool))
{
}

FprintdPlatform::~FprintdPlatform() {
    cancel();
    if (worker_.joinable()) worker_.join();
}

bool FprintdPlatform::canEvaluate(std::string& why) {
    auto user = currentUser();
    if (user.empty()) {
        why = "cannot determine the current user";
        return false;
    }

    ProcessResult res;
    try {
        res = runProcess({listTool_, user});
    }
    catch (const std::system_error& e) {
        spdlog::debug("'{}' not runnable: {}", listTool_, e.what());
        why = "fprintd is not installed";
        return false;
    }

    if (res.exitCode != 0) {
        why = res.err.empty() ? "no fingerprint reader found" : res.err.substr(0, res.err.find('\n'));
        return false;
    }
    // Enrolled fingers are listed as " - #0: right-index-finger"
    if (res.out.find(" - #") == std::string::npos) {
        why = "no fingerprints enrolled for " + user;
        return false;
    }
    return true;
}

void FprintdPlatform::evaluate(const std::string& reason, Reply reply) {
    if (worker_.joinable()) worker_.join();

    auto proc = std::make_shared<Process>(std::vector<std::string>{verifyTool_});
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_ = proc;
    }

    std::cerr << reason << "\nPlace your finger on the fingerprint reader..." << std::endl;

    worker_ = std::thread([this, proc, reply]() {
        bool success = false;
        std::string error;
        try {
            auto res = proc->run();
            success = res.exitCode == 0 && res.out.find("verify-match") != std::string::npos;
            if (!success) {
                if (res.out.find("verify-no-match") != std::string::npos)
                    error = "fingerprint did not match";
                else if (res.exitCode < 0)
                    error = "verification canceled";
                else
                    error = res.err.empty() ? "verification failed" : res.err.substr(0, res.err.find('\n'));
            }
        }
        catch (const std::system_error& e) {
            error = std::string("cannot run ") + verifyTool_ + ": " + e.what();
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (running_ == proc) running_.reset();
        }
        reply(success, error);
    });
}

void FprintdPlatform::cancel() {
    std::shared_ptr<Process> proc;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        proc = running_;
    }
    if (proc) proc->terminate();
}
