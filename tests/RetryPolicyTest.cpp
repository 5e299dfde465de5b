#include <gtest/gtest.h>

#include <chrono>
#include <upload/RetryPolicy.hpp>
#include <vector>

using HealthUploader::RetryPolicy;
using std::chrono::milliseconds;

TEST(RetryPolicyTest, ChunkBackoffDoublesUpToTenSeconds) {
    const auto policy = RetryPolicy::forChunks();
    EXPECT_EQ(policy.maxAttempts, 4);
    EXPECT_EQ(policy.backoff.delayFor(0), milliseconds(1000));
    EXPECT_EQ(policy.backoff.delayFor(1), milliseconds(2000));
    EXPECT_EQ(policy.backoff.delayFor(2), milliseconds(4000));
    EXPECT_EQ(policy.backoff.delayFor(3), milliseconds(8000));
    EXPECT_EQ(policy.backoff.delayFor(4), milliseconds(10000));
    EXPECT_EQ(policy.backoff.delayFor(20), milliseconds(10000));
}

TEST(RetryPolicyTest, ChunkBackoffIsNonDecreasing) {
    const auto policy = RetryPolicy::forChunks(10);
    for (int attempt = 1; attempt < policy.maxAttempts; ++attempt) {
        EXPECT_GE(policy.backoff.delayFor(attempt),
                  policy.backoff.delayFor(attempt - 1));
    }
}

TEST(RetryPolicyTest, ChunkNonRetryableStatuses) {
    const auto policy = RetryPolicy::forChunks();
    EXPECT_TRUE(policy.isNonRetryable(413));
    EXPECT_TRUE(policy.isNonRetryable(401));
    EXPECT_TRUE(policy.isNonRetryable(403));
    EXPECT_FALSE(policy.isNonRetryable(500));
    EXPECT_FALSE(policy.isNonRetryable(404));
    EXPECT_FALSE(policy.isNonRetryable(429));
}

TEST(RetryPolicyTest, MaxRetriesCountsExtraAttempts) {
    EXPECT_EQ(RetryPolicy::forChunks(0).maxAttempts, 1);
    EXPECT_EQ(RetryPolicy::forChunks(5).maxAttempts, 6);
}

TEST(RetryPolicyTest, PollingBackoffGrowsByHalf) {
    const auto policy = RetryPolicy::forJobPolling();
    EXPECT_EQ(policy.maxAttempts, 60);
    const std::vector<milliseconds> expected{
        milliseconds(2000), milliseconds(3000), milliseconds(4500),
        milliseconds(6750), milliseconds(10125)};
    for (int i = 0; i < static_cast<int>(expected.size()); ++i) {
        EXPECT_EQ(policy.backoff.delayFor(i), expected[i]) << i;
    }
    EXPECT_EQ(policy.backoff.delayFor(59), milliseconds(30000));
    EXPECT_FALSE(policy.isNonRetryable(500));
}
