#include "types/ProgressSnapshot.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace bh::types;

std::string_view ProgressSnapshot::toString(const Phase p) noexcept {
    switch (p) {
        case Phase::QUEUED: return "queued";
        case Phase::PREFLIGHT: return "preflight";
        case Phase::TRANSFERRING: return "transferring";
        case Phase::RETRYING: return "retrying";
        case Phase::FINALIZING: return "finalizing";
        case Phase::FINISHED: return "finished";
        default: return "unknown";
    }
}

void bh::types::to_json(nlohmann::json& j, const ProgressSnapshot& s) {
    j = {
        {"execution_id", s.execution_id},
        {"phase", std::string(ProgressSnapshot::toString(s.phase))},
        {"attempt", s.attempt},
        {"bytes_done", s.bytes_done},
        {"bytes_total", s.bytes_total},
        {"percent", s.percent},
        {"rate_bytes_per_sec", s.rate_bytes_per_sec},
        {"files_done", s.files_done},
        {"files_total", s.files_total},
        {"current_file", s.current_file},
        {"formatted_done", bh::util::formatSize(s.bytes_done)},
        {"formatted_total", bh::util::formatSize(s.bytes_total)},
        {"formatted_rate", bh::util::formatSize(static_cast<uintmax_t>(s.rate_bytes_per_sec)) + "/s"}
    };

    if (s.eta_seconds) j["eta_seconds"] = *s.eta_seconds;
    else j["eta_seconds"] = nullptr;
}
