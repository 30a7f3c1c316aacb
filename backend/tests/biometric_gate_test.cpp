#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "mocks.hpp"
#include "auth/BiometricGate.hpp"
#include "core/Errors.hpp"

using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SetArgReferee;

using namespace std::chrono_literals;

namespace {

ErrorKind verifyKind(BiometricGate& gate, std::chrono::milliseconds timeout = 0ms) {
    try {
        gate.verify("Authenticate", timeout);
    }
    catch (const HideMailError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "verify() did not throw";
    return ErrorKind::Unexpected;
}

}  // namespace

TEST(BiometricGateTest, NullPlatformIsUnavailable) {
    BiometricGate gate(nullptr);
    EXPECT_FALSE(gate.isAvailable());
    EXPECT_EQ(ErrorKind::BiometricUnavailable, verifyKind(gate));
}

TEST(BiometricGateTest, AvailabilityIsProbedEveryCall) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    EXPECT_CALL(*platform, canEvaluate(_))
        .WillOnce(Return(true))
        .WillOnce(DoAll(SetArgReferee<0>("passcode removed"), Return(false)));

    BiometricGate gate(platform);
    EXPECT_TRUE(gate.isAvailable());
    EXPECT_FALSE(gate.isAvailable());
}

TEST(BiometricGateTest, UnavailableVerifyDoesNotEvaluate) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    EXPECT_CALL(*platform, canEvaluate(_)).WillOnce(Return(false));
    EXPECT_CALL(*platform, evaluate(_, _)).Times(0);

    BiometricGate gate(platform);
    EXPECT_EQ(ErrorKind::BiometricUnavailable, verifyKind(gate));
}

TEST(BiometricGateTest, ReplyFromAnotherThreadUnblocks) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    std::thread worker;
    EXPECT_CALL(*platform, canEvaluate(_)).WillOnce(Return(true));
    EXPECT_CALL(*platform, evaluate("Check iCloud session", _))
        .WillOnce([&worker](const std::string&, BiometricPlatform::Reply reply) {
            worker = std::thread([reply] {
                std::this_thread::sleep_for(20ms);
                reply(true, "");
            });
        });

    BiometricGate gate(platform);
    EXPECT_NO_THROW(gate.verify("Check iCloud session"));
    worker.join();
}

TEST(BiometricGateTest, FailedReplyIsDenied) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    EXPECT_CALL(*platform, canEvaluate(_)).WillOnce(Return(true));
    EXPECT_CALL(*platform, evaluate(_, _))
        .WillOnce([](const std::string&, BiometricPlatform::Reply reply) {
            reply(false, "no match");
        });

    BiometricGate gate(platform);
    try {
        gate.verify("Authenticate");
        FAIL() << "expected BiometricDenied";
    }
    catch (const HideMailError& e) {
        EXPECT_EQ(ErrorKind::BiometricDenied, e.kind());
        EXPECT_EQ("Biometric authentication failed: no match", std::string(e.what()));
        EXPECT_EQ(SecStatus::AuthFailed, e.statusCode().value_or(0));
    }
}

TEST(BiometricGateTest, DeadlineCancelsAndTimesOut) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    BiometricPlatform::Reply pending;
    EXPECT_CALL(*platform, canEvaluate(_)).WillOnce(Return(true));
    EXPECT_CALL(*platform, evaluate(_, _))
        .WillOnce([&pending](const std::string&, BiometricPlatform::Reply reply) {
            pending = std::move(reply);
        });
    EXPECT_CALL(*platform, cancel()).Times(1);

    BiometricGate gate(platform);
    EXPECT_EQ(ErrorKind::BiometricTimeout, verifyKind(gate, 30ms));

    // A reply that shows up after the deadline is ignored.
    ASSERT_TRUE(pending);
    EXPECT_NO_THROW(pending(true, ""));
}

TEST(BiometricGateTest, DuplicateReplyIsIgnored) {
    auto platform = std::make_shared<MockBiometricPlatform>();
    EXPECT_CALL(*platform, canEvaluate(_)).WillOnce(Return(true));
    EXPECT_CALL(*platform, evaluate(_, _))
        .WillOnce([](const std::string&, BiometricPlatform::Reply reply) {
            reply(true, "");
            reply(false, "late");
        });

    BiometricGate gate(platform);
    EXPECT_NO_THROW(gate.verify("Authenticate", 1000ms));
}
