#include <gtest/gtest.h>

#include "layers/application/RetryPolicy.h"
#include "layers/application/errors.h"
#include "test_support.h"

namespace {

using application::EscalationPolicy;
using application::RetryPolicy;
using application::RetrySettings;

protocol::ReadResult failure(const std::string& error) {
    protocol::ReadResult result;
    result.error = error;
    return result;
}

protocol::ReadResult success(std::vector<std::uint16_t> values) {
    protocol::ReadResult result;
    result.success = true;
    result.values = std::move(values);
    return result;
}

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy makePolicy(int attempts, std::chrono::milliseconds backoff) {
        return RetryPolicy(RetrySettings{attempts, backoff}, sleep.function(), log.sink);
    }

    testing_support::CapturedLog log;
    testing_support::RecordingSleep sleep;
};

TEST_F(RetryPolicyTest, FirstSuccessDoesNotSleep) {
    const auto policy = makePolicy(3, std::chrono::milliseconds(1000));
    int calls = 0;

    const auto outcome = policy.execute([&]() { ++calls; return success({1, 2}); }, EscalationPolicy::SoftFail, "unit 1");

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.block, (std::vector<std::uint16_t>{1, 2}));
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleep.calls.empty());
}

TEST_F(RetryPolicyTest, SoftFailStopsAfterMaxAttempts) {
    const auto policy = makePolicy(3, std::chrono::milliseconds(250));
    int calls = 0;

    const auto outcome = policy.execute([&]() { ++calls; return failure("Timed out"); }, EscalationPolicy::SoftFail, "unit 4");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(outcome.lastError, "Timed out");
    ASSERT_EQ(sleep.calls.size(), 2U);
    EXPECT_EQ(sleep.calls[0], std::chrono::milliseconds(250));
    EXPECT_EQ(sleep.calls[1], std::chrono::milliseconds(250));
}

TEST_F(RetryPolicyTest, RecoversOnLaterAttempt) {
    const auto policy = makePolicy(5, std::chrono::milliseconds(100));
    int calls = 0;

    const auto outcome = policy.execute(
        [&]() { return ++calls < 3 ? failure("CRC mismatch") : success({42}); }, EscalationPolicy::HardFail, "unit 2");

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(sleep.calls.size(), 2U);
}

TEST_F(RetryPolicyTest, HardFailThrowsAfterExhaustion) {
    const auto policy = makePolicy(2, std::chrono::milliseconds(10));
    int calls = 0;

    try {
        policy.execute([&]() { ++calls; return failure("No route to host"); }, EscalationPolicy::HardFail, "station");
        FAIL() << "expected ExhaustedRetriesError";
    } catch (const application::ExhaustedRetriesError& e) {
        EXPECT_EQ(e.attempts(), 2);
        EXPECT_EQ(e.lastError(), "No route to host");
    }
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(sleep.calls.size(), 1U);
}

TEST_F(RetryPolicyTest, SingleAttemptNeverSleeps) {
    const auto policy = makePolicy(1, std::chrono::milliseconds(1000));
    const auto outcome = policy.execute([]() { return failure("x"); }, EscalationPolicy::SoftFail, "unit");

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(sleep.calls.empty());
}

TEST_F(RetryPolicyTest, RejectsZeroAttempts) {
    EXPECT_THROW(makePolicy(0, std::chrono::milliseconds(0)), application::ConfigError);
}

} // namespace
