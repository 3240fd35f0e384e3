#include "types/Execution.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace bh::types;

bool Execution::isTerminal(const State s) noexcept {
    switch (s) {
        case State::SUCCEEDED:
        case State::FAILED:
        case State::CANCELLED:
        case State::TIMED_OUT:
            return true;
        default:
            return false;
    }
}

std::string_view Execution::toString(const State s) noexcept {
    switch (s) {
        case State::PENDING: return "pending";
        case State::RUNNING: return "running";
        case State::RETRYING: return "retrying";
        case State::CANCELLING: return "cancelling";
        case State::SUCCEEDED: return "succeeded";
        case State::FAILED: return "failed";
        case State::CANCELLED: return "cancelled";
        case State::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

bool Execution::tryParseState(const std::string_view in, State& out) noexcept {
    if (in == "pending") out = State::PENDING;
    else if (in == "running") out = State::RUNNING;
    else if (in == "retrying") out = State::RETRYING;
    else if (in == "cancelling") out = State::CANCELLING;
    else if (in == "succeeded") out = State::SUCCEEDED;
    else if (in == "failed") out = State::FAILED;
    else if (in == "cancelled") out = State::CANCELLED;
    else if (in == "timed_out") out = State::TIMED_OUT;
    else return false;
    return true;
}

void bh::types::to_json(nlohmann::json& j, const Execution& e) {
    const auto ts = [](const std::time_t t) -> nlohmann::json {
        if (t == 0) return nullptr;
        return bh::util::timestampToString(t);
    };

    j = {
        {"id", e.id},
        {"job_id", e.job_id},
        {"status", std::string(Execution::toString(e.state))},
        {"attempts", e.retry.attempts_used},
        {"submitted_at", ts(e.submitted_at)},
        {"start_time", ts(e.started_at)},
        {"end_time", ts(e.ended_at)},
        {"duration", e.durationSeconds()},
        {"cancel_requested", e.cancel_requested},
        {"total_size", e.bytes_total},
        {"processed_size", e.bytes_done},
        {"total_files", e.files_total}
    };

    if (e.error) j["error"] = *e.error;
    else j["error"] = nullptr;
}
