#include "backend/retry_policy.h"
#include <gtest/gtest.h>
#include <vector>

using namespace ticketmcp;
using namespace ticketmcp::backend;
using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy make_policy(int max_attempts = 3) {
        RetryConfig config;
        config.max_attempts = max_attempts;
        config.initial_backoff = 100ms;
        config.multiplier = 2.0;
        config.max_backoff = 1000ms;
        return RetryPolicy(config, [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
    }

    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(RetryPolicyTest, BackoffGrowsAndIsCapped) {
    auto policy = make_policy();
    core::ServiceError error(core::ErrorKind::Unavailable, "down");

    EXPECT_EQ(policy.backoff_for(1, error), 100ms);
    EXPECT_EQ(policy.backoff_for(2, error), 200ms);
    EXPECT_EQ(policy.backoff_for(3, error), 400ms);
    EXPECT_EQ(policy.backoff_for(10, error), 1000ms);
}

TEST_F(RetryPolicyTest, RetryAfterIsHonoredUpToTheCap) {
    auto policy = make_policy();
    core::ServiceError short_wait(core::ErrorKind::RateLimited, "slow down");
    short_wait.set_retry_after(0);
    EXPECT_EQ(policy.backoff_for(1, short_wait), 0ms);

    core::ServiceError long_wait(core::ErrorKind::RateLimited, "slow down");
    long_wait.set_retry_after(120);
    EXPECT_EQ(policy.backoff_for(1, long_wait), 1000ms);
}

TEST_F(RetryPolicyTest, TransientFailuresAreRetried) {
    auto policy = make_policy();
    int attempts = 0;

    int value = policy.run("probe", [&] {
        if (++attempts < 3) {
            throw core::ServiceError(core::ErrorKind::RateLimited, "busy");
        }
        return 7;
    });

    EXPECT_EQ(value, 7);
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST_F(RetryPolicyTest, AttemptsAreBounded) {
    auto policy = make_policy(2);
    int attempts = 0;

    EXPECT_THROW(policy.run("probe", [&]() -> int {
        ++attempts;
        throw core::ServiceError(core::ErrorKind::Unavailable, "down");
    }),
                 core::ServiceError);
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST_F(RetryPolicyTest, PermanentFailuresAreNotRetried) {
    auto policy = make_policy();
    const core::ErrorKind permanent[] = {core::ErrorKind::Forbidden, core::ErrorKind::InvalidArgument,
                                         core::ErrorKind::NotFound, core::ErrorKind::Unauthorized,
                                         core::ErrorKind::Unknown};

    for (auto kind: permanent) {
        int attempts = 0;
        EXPECT_THROW(policy.run("probe", [&]() -> int {
            ++attempts;
            throw core::ServiceError(kind, "nope");
        }),
                     core::ServiceError);
        EXPECT_EQ(attempts, 1) << core::to_string(kind);
    }
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryPolicyTest, RecoveryShortCircuitsTheRetry) {
    auto policy = make_policy();
    int attempts = 0;
    int recoveries = 0;

    auto value = policy.run_with_recovery(
            "create",
            [&]() -> int {
                ++attempts;
                throw core::ServiceError(core::ErrorKind::Unavailable, "timeout after send");
            },
            [&]() -> std::optional<int> {
                ++recoveries;
                return 42;
            });

    EXPECT_EQ(value, 42);
    EXPECT_EQ(attempts, 1);
    EXPECT_EQ(recoveries, 1);
}

TEST_F(RetryPolicyTest, ZeroAttemptsMeansOne) {
    RetryConfig config;
    config.max_attempts = 0;
    RetryPolicy policy(config, [](std::chrono::milliseconds) {});
    EXPECT_EQ(policy.config().max_attempts, 1);
}

TEST(ErrorKindTest, OnlyRateLimitedAndUnavailableAreTransient) {
    EXPECT_TRUE(core::is_transient(core::ErrorKind::RateLimited));
    EXPECT_TRUE(core::is_transient(core::ErrorKind::Unavailable));
    EXPECT_FALSE(core::is_transient(core::ErrorKind::Unauthorized));
    EXPECT_FALSE(core::is_transient(core::ErrorKind::Unknown));
    EXPECT_EQ(core::error_kind_from_string("NotFound"), core::ErrorKind::NotFound);
    EXPECT_FALSE(core::error_kind_from_string("Teapot").has_value());
}
