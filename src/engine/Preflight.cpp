#include "engine/Preflight.hpp"
#include "engine/ReservationLedger.hpp"
#include "storage/Volume.hpp"
#include "types/JobSpec.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

using namespace bh::engine;
using namespace bh::types;
using namespace bh::logging;

namespace {

bool pastDeadline(const std::chrono::steady_clock::time_point deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

Failure timeoutFailure() {
    return {Failure::Kind::TIMEOUT, "Execution timeout elapsed during preflight"};
}

}

PreflightChecker::PreflightChecker(std::shared_ptr<storage::Volume> volume, std::shared_ptr<ReservationLedger> ledger)
    : volume_(std::move(volume)), ledger_(std::move(ledger)) {
    if (!volume_ || !ledger_) throw std::invalid_argument("PreflightChecker requires a volume and a reservation ledger");
}

PreflightResult PreflightChecker::check(const std::string& executionId,
                                        const JobSpec& spec,
                                        const uint64_t bytesDurable,
                                        const std::chrono::steady_clock::time_point deadline,
                                        const Manifest* pinned) const {
    PreflightResult result;
    const auto log = LogRegistry::preflight();

    for (const auto& source : spec.sources) {
        if (pastDeadline(deadline)) { result.failure = timeoutFailure(); return result; }

        if (!volume_->exists(source) || !volume_->isReadable(source)) {
            result.failure = Failure{Failure::Kind::UNREACHABLE, fmt::format("Source is not readable: {}", source.string())};
            log->warn("[Preflight] {}: {}", executionId, result.failure->message);
            return result;
        }
    }

    if (!volume_->isWritable(spec.destination)) {
        result.failure = Failure{Failure::Kind::PERMISSION_DENIED,
                                 fmt::format("Destination is not writable: {}", spec.destination.string())};
        log->warn("[Preflight] {}: {}", executionId, result.failure->message);
        return result;
    }

    try {
        result.manifest = pinned ? refreshManifest(*pinned, *volume_) : resolveManifest(spec, *volume_);
    } catch (const std::filesystem::filesystem_error& e) {
        result.failure = Failure{Failure::Kind::UNREACHABLE, fmt::format("Failed to enumerate sources: {}", e.what())};
        log->warn("[Preflight] {}: {}", executionId, result.failure->message);
        return result;
    }

    if (pastDeadline(deadline)) { result.failure = timeoutFailure(); return result; }

    const auto total = result.manifest.totalBytes();
    const auto pending = total > bytesDurable ? total - bytesDurable : 0;

    uintmax_t freeBytes = 0;
    try {
        freeBytes = volume_->freeSpace(spec.destination);
    } catch (const std::filesystem::filesystem_error& e) {
        result.failure = Failure{Failure::Kind::UNREACHABLE, fmt::format("Failed to query free space: {}", e.what())};
        log->warn("[Preflight] {}: {}", executionId, result.failure->message);
        return result;
    }

    if (!ledger_->reserveSpace(executionId, pending, freeBytes, spec.min_free_space)) {
        const auto reserved = ledger_->queryConcurrentReservations();
        result.failure = Failure{
            Failure::Kind::INSUFFICIENT_SPACE,
            fmt::format("Insufficient space on destination: {} free, {} reserved by other executions, "
                        "{} required plus {} minimum free",
                        util::formatSize(freeBytes), util::formatSize(reserved),
                        util::formatSize(pending), util::formatSize(spec.min_free_space))
        };
        log->warn("[Preflight] {}: {}", executionId, result.failure->message);
        return result;
    }

    log->debug("[Preflight] {}: {} files, {} total, {} reserved",
               executionId, result.manifest.size(), util::formatSize(total), util::formatSize(pending));
    return result;
}

void PreflightChecker::release(const std::string& executionId) const {
    ledger_->releaseSpace(executionId);
}
