#include <gtest/gtest.h>
#include "engine/RetryPolicy.hpp"
#include "types/JobSpec.hpp"

using namespace bh::engine;
using namespace bh::types;
using namespace std::chrono;

TEST(RetryPolicyTest, TransientFailuresAreRetryable) {
    EXPECT_TRUE(RetryPolicy::isRetryable(Failure::Kind::INSUFFICIENT_SPACE));
    EXPECT_TRUE(RetryPolicy::isRetryable(Failure::Kind::UNREACHABLE));
    EXPECT_TRUE(RetryPolicy::isRetryable(Failure::Kind::TRANSFER_IO));
    EXPECT_TRUE(RetryPolicy::isRetryable(Failure::Kind::RESUME_MISMATCH));
}

TEST(RetryPolicyTest, PermissionCancelAndTimeoutAreFinal) {
    EXPECT_FALSE(RetryPolicy::isRetryable(Failure::Kind::PERMISSION_DENIED));
    EXPECT_FALSE(RetryPolicy::isRetryable(Failure::Kind::CANCELLED));
    EXPECT_FALSE(RetryPolicy::isRetryable(Failure::Kind::TIMEOUT));
}

TEST(RetryPolicyTest, FixedDelayUntilRetriesAreSpent) {
    const FixedDelayRetryPolicy policy;
    JobSpec spec;

    for (unsigned int attempt = 1; attempt <= 3; ++attempt) {
        const auto d = policy.decide(Failure::Kind::TRANSFER_IO, attempt, spec);
        EXPECT_TRUE(d.retry) << "attempt " << attempt;
        EXPECT_EQ(d.delay, seconds(5));
    }

    EXPECT_FALSE(policy.decide(Failure::Kind::TRANSFER_IO, 4, spec).retry);
}

TEST(RetryPolicyTest, HonoursJobOverrides) {
    const FixedDelayRetryPolicy policy;
    JobSpec spec;
    spec.max_retry_attempts = 1;
    spec.retry_delay = milliseconds(250);

    const auto first = policy.decide(Failure::Kind::INSUFFICIENT_SPACE, 1, spec);
    EXPECT_TRUE(first.retry);
    EXPECT_EQ(first.delay, milliseconds(250));
    EXPECT_FALSE(policy.decide(Failure::Kind::INSUFFICIENT_SPACE, 2, spec).retry);
}

TEST(RetryPolicyTest, ZeroRetriesNeverRetries) {
    const FixedDelayRetryPolicy policy;
    JobSpec spec;
    spec.max_retry_attempts = 0;
    EXPECT_FALSE(policy.decide(Failure::Kind::TRANSFER_IO, 1, spec).retry);
}

TEST(RetryPolicyTest, NonRetryableGivesUpImmediately) {
    const FixedDelayRetryPolicy policy;
    const JobSpec spec;
    EXPECT_FALSE(policy.decide(Failure::Kind::PERMISSION_DENIED, 1, spec).retry);
    EXPECT_FALSE(policy.decide(Failure::Kind::TIMEOUT, 1, spec).retry);
    EXPECT_FALSE(policy.decide(Failure::Kind::CANCELLED, 1, spec).retry);
}
