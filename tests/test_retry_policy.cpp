#include <gtest/gtest.h>
#include <managers/retry_policy.hpp>
#include <core/errors.hpp>
#include <stdexcept>
#include <vector>

class RetryPolicyTest : public ::testing::Test {
protected:
    std::vector<int> sleeps;

    RetryPolicy make(int max_retries, int base_delay_ms) {
        return RetryPolicy(max_retries, base_delay_ms, [this](int ms) { sleeps.push_back(ms); });
    }
};

TEST(RetryClassificationTest, Statuses) {
    for (int s : {408, 425, 429, 500, 502, 503, 504, 599}) {
        EXPECT_TRUE(is_retryable_status(s)) << s;
    }
    for (int s : {200, 201, 301, 400, 401, 403, 404, 409, 600}) {
        EXPECT_FALSE(is_retryable_status(s)) << s;
    }
}

TEST(RetryClassificationTest, Errors) {
    EXPECT_TRUE(is_retryable_error(RemoteError("x", 503, true)));
    EXPECT_FALSE(is_retryable_error(RemoteError("x", 403, false)));
    EXPECT_TRUE(is_retryable_error(TransportError("timeout", true)));
    EXPECT_FALSE(is_retryable_error(TransportError("bad url", false)));
    EXPECT_FALSE(is_retryable_error(LocalIOError("disk")));
    EXPECT_FALSE(is_retryable_error(std::runtime_error("other")));
}

TEST_F(RetryPolicyTest, SucceedsAfterTransientFailures) {
    auto policy = make(2, 600);
    int calls = 0;
    int result = policy.run("op", [&]() {
        if (++calls < 3) throw RemoteError("busy", 503, true);
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, (std::vector<int>{600, 1200}));
}

TEST_F(RetryPolicyTest, BoundedAttempts) {
    auto policy = make(2, 10);
    int calls = 0;
    EXPECT_THROW(policy.run("op", [&]() { calls++; throw TransportError("reset", true); }),
                 TransportError);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RetryPolicyTest, NonRetryablePropagatesImmediately) {
    auto policy = make(5, 10);
    int calls = 0;
    try {
        policy.run("op", [&]() { calls++; throw RemoteError("forbidden", 403, false); });
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.status(), 403);
    }
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryPolicyTest, ZeroRetries) {
    auto policy = make(0, 10);
    int calls = 0;
    EXPECT_THROW(policy.run("op", [&]() { calls++; throw RemoteError("busy", 503, true); }),
                 RemoteError);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, NegativeSettingsClamp) {
    auto policy = make(-3, -5);
    EXPECT_EQ(policy.max_retries(), 0);
    EXPECT_EQ(policy.delay_for(4), 0);
}

TEST_F(RetryPolicyTest, LinearDelay) {
    auto policy = make(3, 250);
    EXPECT_EQ(policy.delay_for(0), 250);
    EXPECT_EQ(policy.delay_for(1), 500);
    EXPECT_EQ(policy.delay_for(2), 750);
}

TEST_F(RetryPolicyTest, LargeBaseDelayIsCapped) {
    auto policy = make(3, 2000000000);
    EXPECT_EQ(policy.delay_for(0), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(policy.delay_for(2), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(make(3, 1000).delay_for(2), 3000);
}
