#pragma once

#include "types/Failure.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace bh::types {

struct RetryState {
    unsigned int attempts_used{0};
    std::chrono::milliseconds next_delay{0};
    std::optional<Failure::Kind> last_failure;
};

struct Execution {
    // Mirrors the persisted status column
    enum class State : uint8_t {
        PENDING,
        RUNNING,
        RETRYING,
        CANCELLING,
        SUCCEEDED,
        FAILED,
        CANCELLED,
        TIMED_OUT
    };

    std::string id;
    std::string job_id;
    State state{State::PENDING};
    RetryState retry;

    // 0 means not set
    std::time_t submitted_at{0};
    std::time_t started_at{0};
    std::time_t ended_at{0};

    std::optional<Failure> error;
    bool cancel_requested{false};

    uint64_t bytes_total{0};
    uint64_t bytes_done{0};
    std::size_t files_total{0};

    [[nodiscard]] bool isTerminal() const noexcept { return isTerminal(state); }

    [[nodiscard]] std::time_t durationSeconds() const noexcept {
        if (started_at == 0) return 0;
        const std::time_t end = (ended_at != 0) ? ended_at : std::time(nullptr);
        return (end >= started_at) ? (end - started_at) : 0;
    }

    static bool isTerminal(State s) noexcept;
    static std::string_view toString(State s) noexcept;
    static bool tryParseState(std::string_view in, State& out) noexcept;
};

void to_json(nlohmann::json& j, const Execution& e);

}
