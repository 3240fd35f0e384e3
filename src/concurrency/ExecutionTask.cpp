#include "concurrency/ExecutionTask.hpp"
#include "engine/Manifest.hpp"
#include "engine/Preflight.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/RetryPolicy.hpp"
#include "services/Collaborators.hpp"
#include "storage/Volume.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

using namespace bh::concurrency;
using namespace bh::engine;
using namespace bh::types;
using namespace bh::logging;
using namespace std::chrono;

using Phase = ProgressSnapshot::Phase;
using State = Execution::State;

ExecutionTask::ExecutionTask(Execution execution, JobSpec spec, ExecutionDeps deps)
    : next_run(steady_clock::now()),
      id_(execution.id),
      spec_(std::move(spec)),
      deps_(std::move(deps)),
      cancelToken_(std::make_shared<std::atomic<bool>>(false)),
      execution_(std::move(execution)) {
    if (!deps_.volume || !deps_.preflight || !deps_.retryPolicy || !deps_.tracker || !deps_.store || !deps_.notifier)
        throw std::invalid_argument("ExecutionTask is missing a dependency");
}

void ExecutionTask::operator()() {
    try {
        runAttempt();
    } catch (const std::exception& e) {
        LogRegistry::worker()->error("[ExecutionTask] {} attempt aborted: {}", id_, e.what());
        handleFailure(Failure{Failure::Kind::TRANSFER_IO, e.what()});
    }
}

void ExecutionTask::submitted() {
    persist(execution());
    jobLog("submitted", spec_.name);
}

Execution ExecutionTask::execution() const {
    std::scoped_lock lock(mutex_);
    return execution_;
}

bool ExecutionTask::isTerminal() const {
    std::scoped_lock lock(mutex_);
    return execution_.isTerminal();
}

bool ExecutionTask::awaitingRetry() const {
    std::scoped_lock lock(mutex_);
    return execution_.state == State::RETRYING;
}

bool ExecutionTask::requestCancel() {
    Execution snap;
    {
        std::scoped_lock lock(mutex_);
        if (execution_.isTerminal()) return false;
        if (execution_.cancel_requested) return true;
        execution_.cancel_requested = true;
        cancelToken_->store(true);
        if (execution_.state == State::RUNNING) execution_.state = State::CANCELLING;
        snap = execution_;
    }
    LogRegistry::worker()->info("[ExecutionTask] Cancellation requested for {}", id_);
    persist(snap);
    return true;
}

void ExecutionTask::cancelWhileWaiting() {
    {
        std::scoped_lock lock(mutex_);
        execution_.cancel_requested = true;
    }
    cancelToken_->store(true);
    finishCancelled();
}

std::optional<steady_clock::time_point> ExecutionTask::deadline() const {
    std::scoped_lock lock(mutex_);
    return deadline_;
}

bool ExecutionTask::deadlineExpired(const steady_clock::time_point now) const {
    std::scoped_lock lock(mutex_);
    return execution_.state == State::RETRYING && deadline_ && now >= *deadline_;
}

void ExecutionTask::timeoutWhileWaiting() {
    finishTimedOut("the retry delay");
}

bool ExecutionTask::timedOut() const {
    std::scoped_lock lock(mutex_);
    return deadline_ && steady_clock::now() >= *deadline_;
}

void ExecutionTask::runAttempt() {
    Execution snap;
    steady_clock::time_point deadline;
    bool cancelled = false;
    {
        std::scoped_lock lock(mutex_);
        if (execution_.isTerminal()) return;

        // requestCancel() takes the same lock, so a cancel either lands here
        // or sees RUNNING and moves the execution to CANCELLING
        if (execution_.cancel_requested) cancelled = true;
        else {
            if (!deadline_) {
                execution_.started_at = std::time(nullptr);
                deadline_ = steady_clock::now() + spec_.execution_timeout;
            }
            deadline = *deadline_;
            execution_.state = State::RUNNING;
            ++execution_.retry.attempts_used;
            execution_.retry.next_delay = milliseconds(0);
            snap = execution_;
        }
    }

    if (cancelled) {
        finishCancelled();
        return;
    }

    if (timedOut()) {
        finishTimedOut("admission");
        return;
    }

    const auto attempt = snap.retry.attempts_used;
    deps_.tracker->startAttempt(id_, attempt);
    persist(snap);

    LogRegistry::worker()->info("[ExecutionTask] {} (job '{}') attempt {}/{} started",
                                id_, spec_.id, attempt, spec_.max_retry_attempts + 1);

    const auto preflight = deps_.preflight->check(id_, spec_, durableOffset_, deadline,
                                                  manifest_ ? &*manifest_ : nullptr);
    if (!preflight.ok()) {
        handleFailure(*preflight.failure);
        return;
    }

    manifest_ = preflight.manifest;
    const auto& manifest = *manifest_;
    const auto total = manifest.totalBytes();

    // Sources shrank since the last attempt; the old offset means nothing now
    if (durableOffset_ > total) durableOffset_ = 0;

    {
        std::scoped_lock lock(mutex_);
        execution_.bytes_total = total;
        execution_.files_total = manifest.size();
        execution_.bytes_done = durableOffset_;
    }

    if (timedOut()) {
        finishTimedOut("preflight");
        return;
    }

    if (!transfer(manifest)) return;

    deps_.tracker->setPhase(id_, Phase::FINALIZING);

    if (durableOffset_ != total) {
        handleFailure(Failure{Failure::Kind::TRANSFER_IO,
                              fmt::format("Transferred {} of {} bytes", durableOffset_, total)});
        return;
    }

    finish(State::SUCCEEDED);
}

bool ExecutionTask::transfer(const Manifest& manifest) {
    const auto [first, offsetInFirst] = manifest.locate(durableOffset_);

    deps_.tracker->beginTransfer(id_, manifest.totalBytes(), durableOffset_, manifest.size(), first);

    for (std::size_t i = first; i < manifest.size(); ++i) {
        const auto& entry = manifest.entries[i];
        const auto base = manifest.startOffset(i);

        deps_.tracker->setCurrentFile(id_, entry.source.string(), i);

        TransferEngine engine(deps_.volume,
                              {entry.source, entry.destination, entry.size, spec_.chunk_size,
                               i == first ? offsetInFirst : 0, spec_.checksum_chunks, i},
                              cancelToken_);

        while (auto unit = engine.next()) {
            if (!unit->success) break;

            unit->offset += base;
            durableOffset_ = unit->end();
            deps_.tracker->record(id_, *unit);

            {
                std::scoped_lock lock(mutex_);
                execution_.bytes_done = durableOffset_;
            }

            if (timedOut()) {
                finishTimedOut("transfer");
                return false;
            }
        }

        if (engine.cancelled()) {
            finishCancelled();
            return false;
        }

        if (const auto& failure = engine.failure()) {
            // A mismatched destination cannot be trusted; start the whole stream over
            durableOffset_ = failure->kind == Failure::Kind::RESUME_MISMATCH ? 0 : base + engine.flushedOffset();
            handleFailure(*failure);
            return false;
        }

        try {
            deps_.volume->setLastWriteTime(entry.destination, entry.modified);
        } catch (const std::filesystem::filesystem_error& e) {
            LogRegistry::transfer()->warn("[ExecutionTask] {} could not carry over mtime of {}: {}",
                                          id_, entry.source.string(), e.what());
        }

        jobLog("copied", fmt::format("{},{},{}", entry.source.string(), entry.destination.string(), entry.size));
        LogRegistry::transfer()->debug("[ExecutionTask] {} copied {} ({})",
                                       id_, entry.source.string(), util::formatSize(entry.size));
    }

    deps_.tracker->setCurrentFile(id_, "", manifest.size());
    return true;
}

void ExecutionTask::handleFailure(const Failure& failure) {
    deps_.preflight->release(id_);

    if (cancelRequested() || failure.kind == Failure::Kind::CANCELLED) {
        finishCancelled();
        return;
    }

    if (failure.kind == Failure::Kind::TIMEOUT) {
        finish(State::TIMED_OUT, failure);
        return;
    }

    unsigned int attempts = 0;
    {
        std::scoped_lock lock(mutex_);
        execution_.retry.last_failure = failure.kind;
        attempts = execution_.retry.attempts_used;
    }

    const auto decision = deps_.retryPolicy->decide(failure.kind, attempts, spec_);
    if (!decision.retry) {
        LogRegistry::worker()->error("[ExecutionTask] {} failed after {} attempt(s) with {}: {}",
                                     id_, attempts, std::string(Failure::toString(failure.kind)), failure.message);
        finish(State::FAILED, failure);
        return;
    }

    Execution snap;
    {
        std::scoped_lock lock(mutex_);
        if (execution_.isTerminal()) return;
        execution_.state = State::RETRYING;
        execution_.retry.next_delay = decision.delay;
        execution_.bytes_done = durableOffset_;

        const auto wake = steady_clock::now() + decision.delay;
        next_run = (deadline_ && *deadline_ < wake) ? *deadline_ : wake;
        snap = execution_;
    }

    deps_.tracker->setPhase(id_, Phase::RETRYING);
    persist(snap);

    LogRegistry::worker()->warn("[ExecutionTask] {} attempt {} failed with {}: {}; retrying in {} ms",
                                id_, attempts, std::string(Failure::toString(failure.kind)), failure.message,
                                decision.delay.count());
    jobLog("retry", fmt::format("{},{}", std::string(Failure::toString(failure.kind)), failure.message));
}

void ExecutionTask::finish(const State state, std::optional<Failure> error) {
    Execution snap;
    {
        std::scoped_lock lock(mutex_);
        if (execution_.isTerminal()) return;
        execution_.state = state;
        execution_.ended_at = std::time(nullptr);
        execution_.error = std::move(error);
        execution_.bytes_done = durableOffset_;
        snap = execution_;
    }

    deps_.preflight->release(id_);
    deps_.tracker->finish(id_);
    persist(snap);

    try {
        deps_.notifier->notifyOutcome(snap);
    } catch (const std::exception& e) {
        LogRegistry::worker()->error("[ExecutionTask] Failed to notify outcome of {}: {}", id_, e.what());
    }

    const auto status = std::string(Execution::toString(state));
    if (state == State::SUCCEEDED)
        LogRegistry::worker()->info("[ExecutionTask] {} succeeded: {} in {} attempt(s)",
                                    id_, util::formatSize(snap.bytes_done), snap.retry.attempts_used);
    else
        LogRegistry::worker()->warn("[ExecutionTask] {} finished as {}: {}",
                                    id_, status, snap.error ? snap.error->message : std::string());

    jobLog("finished", status);

    if (deps_.onTerminal) deps_.onTerminal(snap);
}

void ExecutionTask::finishCancelled() {
    finish(State::CANCELLED, Failure{Failure::Kind::CANCELLED, "Cancelled by request"});
}

void ExecutionTask::finishTimedOut(const std::string& where) {
    finish(State::TIMED_OUT,
           Failure{Failure::Kind::TIMEOUT,
                   fmt::format("Execution exceeded its {} ms timeout during {}",
                               spec_.execution_timeout.count(), where)});
}

void ExecutionTask::persist(const Execution& snapshot) const {
    try {
        deps_.store->persistExecutionState(snapshot);
    } catch (const std::exception& e) {
        LogRegistry::worker()->error("[ExecutionTask] Failed to persist state of {}: {}", id_, e.what());
    }
}

void ExecutionTask::jobLog(const std::string& event, const std::string& detail) const {
    try {
        LogRegistry::jobLog(spec_.id)->info("{},{},{}", id_, event, detail);
    } catch (const std::exception& e) {
        LogRegistry::worker()->warn("[ExecutionTask] Job log unavailable for '{}': {}", spec_.id, e.what());
    }
}
