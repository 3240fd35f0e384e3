#pragma once

#include "engine/Manifest.hpp"
#include "types/Failure.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bh::types { struct JobSpec; }
namespace bh::storage { class Volume; }

namespace bh::engine {

class ReservationLedger;

struct PreflightResult {
    std::optional<types::Failure> failure;
    Manifest manifest;

    [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }
};

class PreflightChecker {
public:
    PreflightChecker(std::shared_ptr<storage::Volume> volume, std::shared_ptr<ReservationLedger> ledger);

    // Validates sources, destination and free space for one attempt. bytesDurable
    // is what earlier attempts already wrote and no longer needs reserving.
    // On success the execution holds a reservation until release() is called.
    // A pinned manifest from an earlier attempt is re-read instead of resolved
    // again, so resumed offsets keep pointing at the same files.
    [[nodiscard]] PreflightResult check(const std::string& executionId,
                                        const types::JobSpec& spec,
                                        uint64_t bytesDurable,
                                        std::chrono::steady_clock::time_point deadline,
                                        const Manifest* pinned = nullptr) const;

    void release(const std::string& executionId) const;

private:
    std::shared_ptr<storage::Volume> volume_;
    std::shared_ptr<ReservationLedger> ledger_;
};

}
