#pragma once

#include "concurrency/Task.hpp"
#include "engine/Manifest.hpp"
#include "engine/TransferEngine.hpp"
#include "types/Execution.hpp"
#include "types/JobSpec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace bh::storage { class Volume; }

namespace bh::engine {
class PreflightChecker;
class ProgressTracker;
class RetryPolicy;
}

namespace bh::services {
class ExecutionStore;
class OutcomeNotifier;
}

namespace bh::concurrency {

struct ExecutionDeps {
    std::shared_ptr<storage::Volume> volume;
    std::shared_ptr<engine::PreflightChecker> preflight;
    std::shared_ptr<engine::RetryPolicy> retryPolicy;
    std::shared_ptr<engine::ProgressTracker> tracker;
    std::shared_ptr<services::ExecutionStore> store;
    std::shared_ptr<services::OutcomeNotifier> notifier;
    std::function<void(const types::Execution&)> onTerminal;
};

// Drives one execution through its state machine. Each call runs a single
// attempt; a retryable failure leaves the task in RETRYING with next_run set
// and the owner re-admits it once the delay has passed.
class ExecutionTask : public Task, public std::enable_shared_from_this<ExecutionTask> {
public:
    std::chrono::steady_clock::time_point next_run;
    uint64_t sequence{0};

    ExecutionTask(types::Execution execution, types::JobSpec spec, ExecutionDeps deps);
    ~ExecutionTask() override = default;

    void operator()() override;

    // Publishes the initial PENDING state
    void submitted();

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const types::JobSpec& spec() const noexcept { return spec_; }
    [[nodiscard]] types::Execution execution() const;

    [[nodiscard]] bool isTerminal() const;
    [[nodiscard]] bool awaitingRetry() const;
    [[nodiscard]] bool cancelRequested() const noexcept { return cancelToken_->load(); }

    // Flags a running execution for cooperative cancellation. Returns false
    // once the execution is terminal.
    bool requestCancel();

    // Cancels an execution that holds no slot (pending or waiting out a retry delay)
    void cancelWhileWaiting();

    // Set once the first attempt starts
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> deadline() const;

    // True when a retry wait has run past the execution deadline
    [[nodiscard]] bool deadlineExpired(std::chrono::steady_clock::time_point now) const;

    void timeoutWhileWaiting();

private:
    const std::string id_;
    const types::JobSpec spec_;
    ExecutionDeps deps_;
    engine::CancelToken cancelToken_;

    mutable std::mutex mutex_;
    types::Execution execution_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    // Stream offset known to be flushed at the destination; the next attempt resumes here
    uint64_t durableOffset_{0};

    // File set fixed by the first successful preflight
    std::optional<engine::Manifest> manifest_;

    void runAttempt();
    bool transfer(const engine::Manifest& manifest);

    void handleFailure(const types::Failure& failure);

    void finish(types::Execution::State state, std::optional<types::Failure> error = std::nullopt);
    void finishCancelled();
    void finishTimedOut(const std::string& where);

    [[nodiscard]] bool timedOut() const;

    void persist(const types::Execution& snapshot) const;
    void jobLog(const std::string& event, const std::string& detail) const;
};

}
