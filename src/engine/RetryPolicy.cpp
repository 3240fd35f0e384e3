#include "engine/RetryPolicy.hpp"
#include "types/JobSpec.hpp"

using namespace bh::engine;
using namespace bh::types;

bool RetryPolicy::isRetryable(const Failure::Kind kind) noexcept {
    switch (kind) {
        case Failure::Kind::INSUFFICIENT_SPACE:
        case Failure::Kind::UNREACHABLE:
        case Failure::Kind::TRANSFER_IO:
        case Failure::Kind::RESUME_MISMATCH: return true;
        case Failure::Kind::PERMISSION_DENIED:
        case Failure::Kind::TIMEOUT:
        case Failure::Kind::CANCELLED: return false;
    }
    return false;
}

RetryDecision FixedDelayRetryPolicy::decide(const Failure::Kind kind,
                                            const unsigned int attemptsUsed,
                                            const JobSpec& spec) const {
    if (!isRetryable(kind)) return RetryDecision::giveUp();
    if (attemptsUsed > spec.max_retry_attempts) return RetryDecision::giveUp();
    return RetryDecision::after(spec.retry_delay);
}
