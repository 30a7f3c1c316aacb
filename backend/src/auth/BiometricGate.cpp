#include "BiometricGate.hpp"
#include "../core/Errors.hpp"

#include <atomic>
#include <future>
#include <utility>
#include <spdlog/spdlog.h>

bool NullBiometricPlatform::canEvaluate(std::string& why) {
    why = "biometric verification is disabled";
    return false;
}

void NullBiometricPlatform::evaluate(const std::string&, Reply reply) {
    reply(false, "biometric verification is disabled");
}

BiometricGate::BiometricGate(std::shared_ptr<BiometricPlatform> platform)
    : platform_(std::move(platform))
{
    if (!platform_)
        platform_ = std::make_shared<NullBiometricPlatform>();
}

bool BiometricGate::isAvailable() {
    std::string why;
    bool ok = platform_->canEvaluate(why);
    if (!ok)
        spdlog::debug("Biometric verification unavailable: {}", why);
    return ok;
}

void BiometricGate::verify(const std::string& reason, std::chrono::milliseconds timeout) {
    std::string why;
    if (!platform_->canEvaluate(why)) {
        spdlog::warn("Biometric verification requested but unavailable: {}", why);
        throw HideMailError(ErrorKind::BiometricUnavailable,
                            why.empty() ? "Biometric verification not available" : why,
                            SecStatus::PasscodeNotSet);
    }

    // One-shot completion shared with the platform callback. The callback may
    // outlive this frame when we give up on a deadline.
    struct Completion {
        std::promise<std::pair<bool, std::string>> promise;
        std::atomic<bool> resolved{false};
    };
    auto completion = std::make_shared<Completion>();
    auto result = completion->promise.get_future();

    spdlog::info("Requesting biometric verification");
    platform_->evaluate(reason, [completion](bool success, const std::string& error) {
        if (!completion->resolved.exchange(true))
            completion->promise.set_value({success, error});
    });

    if (timeout.count() <= 0) {
        result.wait();
    }
    else if (result.wait_for(timeout) == std::future_status::timeout) {
        spdlog::warn("Biometric verification timed out after {} ms", timeout.count());
        platform_->cancel();
        throw HideMailError(ErrorKind::BiometricTimeout,
                            "Biometric verification timed out", SecStatus::AuthCanceled);
    }

    auto outcome = result.get();
    if (!outcome.first) {
        spdlog::warn("Biometric verification failed: {}", outcome.second);
        throw HideMailError(ErrorKind::BiometricDenied,
                            "Biometric authentication failed: " +
                                (outcome.second.empty() ? std::string("denied") : outcome.second),
                            SecStatus::AuthFailed);
    }
    spdlog::info("Biometric verification succeeded");
}
