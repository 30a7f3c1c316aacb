#pragma once
#include "BiometricGate.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Process;

// Fingerprint verification through the fprintd command-line clients.
// Availability requires at least one enrolled finger for the current user.
class FprintdPlatform : public BiometricPlatform {
public:
    explicit FprintdPlatform(std::string listTool = "fprintd-list",
                             std::string verifyTool = "fprintd-verify");
    ~FprintdPlatform() override;

    bool canEvaluate(std::string& why) override;
    void evaluate(const std::string& reason, Reply reply) override;
    void cancel() override;

private:
    std::string listTool_;
    std::string verifyTool_;

    std::mutex mtx_;
    std::shared_ptr<Process> running_;
    std::thread worker_;
};
