#pragma once

#include "types/Failure.hpp"

#include <chrono>

namespace bh::types { struct JobSpec; }

namespace bh::engine {

struct RetryDecision {
    bool retry{false};
    std::chrono::milliseconds delay{0};

    static RetryDecision giveUp() { return {}; }
    static RetryDecision after(const std::chrono::milliseconds d) { return {true, d}; }
};

class RetryPolicy {
public:
    virtual ~RetryPolicy() = default;

    // attemptsUsed counts the attempt that just failed
    [[nodiscard]] virtual RetryDecision decide(types::Failure::Kind kind,
                                               unsigned int attemptsUsed,
                                               const types::JobSpec& spec) const = 0;

    static bool isRetryable(types::Failure::Kind kind) noexcept;
};

// Retries retryable failures after the job's retry_delay until
// max_retry_attempts retries have been spent.
class FixedDelayRetryPolicy final : public RetryPolicy {
public:
    [[nodiscard]] RetryDecision decide(types::Failure::Kind kind,
                                       unsigned int attemptsUsed,
                                       const types::JobSpec& spec) const override;
};

}
