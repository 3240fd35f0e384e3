#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace bh::types {

struct ProgressSnapshot {
    enum class Phase : uint8_t {
        QUEUED,
        PREFLIGHT,
        TRANSFERRING,
        RETRYING,
        FINALIZING,
        FINISHED
    };

    std::string execution_id;
    Phase phase{Phase::QUEUED};
    unsigned int attempt{0};

    uint64_t bytes_done{0};
    uint64_t bytes_total{0};
    double percent{0.0};
    double rate_bytes_per_sec{0.0};
    std::optional<double> eta_seconds; // unknown while the rate is zero

    std::size_t files_done{0};
    std::size_t files_total{0};
    std::string current_file;

    static std::string_view toString(Phase p) noexcept;
};

void to_json(nlohmann::json& j, const ProgressSnapshot& s);

}
