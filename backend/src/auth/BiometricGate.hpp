#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// Platform biometric primitive. evaluate() returns immediately; the reply is
// delivered later, usually on another thread, exactly once.
class BiometricPlatform {
public:
    using Reply = std::function<void(bool success, const std::string& error)>;

    virtual ~BiometricPlatform() = default;

    // False if there is no hardware or a precondition (enrolment, passcode) is unmet.
    virtual bool canEvaluate(std::string& why) = 0;
    virtual void evaluate(const std::string& reason, Reply reply) = 0;
    // Abandons an outstanding evaluate(); a late reply may still arrive and is ignored.
    virtual void cancel() = 0;
};

// Always unavailable. Used when biometrics are switched off in the config.
class NullBiometricPlatform : public BiometricPlatform {
public:
    bool canEvaluate(std::string& why) override;
    void evaluate(const std::string& reason, Reply reply) override;
    void cancel() override {}
};

// Synchronous front for a BiometricPlatform.
class BiometricGate {
public:
    explicit BiometricGate(std::shared_ptr<BiometricPlatform> platform);

    // Re-probed on every call; device state can change between calls.
    bool isAvailable();

    // Blocks until the platform answers. A zero timeout waits forever.
    // Throws HideMailError with BiometricUnavailable, BiometricDenied or
    // BiometricTimeout.
    void verify(const std::string& reason,
                std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

private:
    std::shared_ptr<BiometricPlatform> platform_;
};
