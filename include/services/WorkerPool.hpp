#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"
#include "types/Execution.hpp"
#include "types/JobSpec.hpp"
#include "types/ProgressSnapshot.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bh::storage { class Volume; }

namespace bh::engine {
class PreflightChecker;
class ProgressTracker;
class ReservationLedger;
class RetryPolicy;
}

namespace bh::concurrency {
class ExecutionTask;
class ThreadPool;
}

namespace bh::services {

class ExecutionStore;
class OutcomeNotifier;

// Outbound seams. Anything left null gets the in-process default.
struct Collaborators {
    std::shared_ptr<ExecutionStore> store;
    std::shared_ptr<OutcomeNotifier> notifier;
    std::shared_ptr<engine::ReservationLedger> ledger;
    std::shared_ptr<storage::Volume> volume;
    std::shared_ptr<engine::RetryPolicy> retryPolicy;
};

// Owns every execution submitted to it and admits them, first come first
// served, onto at most max_concurrent_jobs worker threads. Executions waiting
// out a retry delay give their slot back and are re-admitted when due.
// Terminal executions stay queryable until retained_executions newer ones
// have finished.
class WorkerPool final : public AsyncService {
public:
    explicit WorkerPool(config::EngineConfig config, Collaborators collaborators = {});
    ~WorkerPool() override;

    void start() override;

    // Cancels everything still in flight and joins the worker threads
    void stop() override;

    // Throws std::invalid_argument for an invalid job and std::runtime_error
    // once the pool has been stopped
    std::string submit(const types::JobSpec& spec);

    // False for unknown or already terminal executions
    bool cancel(const std::string& executionId);

    [[nodiscard]] std::optional<types::ProgressSnapshot> progress(const std::string& executionId) const;

    // Set only once the execution is terminal
    [[nodiscard]] std::optional<types::Execution> outcome(const std::string& executionId) const;

    [[nodiscard]] std::optional<types::Execution> execution(const std::string& executionId) const;

    std::optional<types::Execution> awaitOutcome(const std::string& executionId,
                                                 std::chrono::milliseconds timeout);

    [[nodiscard]] std::vector<std::string> executionIds() const;

    [[nodiscard]] unsigned int runningCount() const;
    [[nodiscard]] unsigned int peakRunning() const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] bool idle() const;

    [[nodiscard]] const config::EngineConfig& config() const { return config_; }
    [[nodiscard]] const std::shared_ptr<engine::ProgressTracker>& tracker() const { return tracker_; }

protected:
    void runLoop() override;

private:
    struct Admission;

    const config::EngineConfig config_;
    Collaborators collaborators_;

    std::shared_ptr<engine::ProgressTracker> tracker_;
    std::shared_ptr<engine::PreflightChecker> preflight_;
    std::unique_ptr<concurrency::ThreadPool> threads_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // Executions not holding a slot, keyed by submission order
    std::map<uint64_t, std::shared_ptr<concurrency::ExecutionTask>> waiting_;
    std::unordered_set<std::string> active_;
    std::unordered_map<std::string, std::shared_ptr<concurrency::ExecutionTask>> tasks_;
    std::deque<std::string> retired_; // terminal ids, oldest first

    uint64_t nextSequence_{0};
    unsigned int peakRunning_{0};
    bool stopped_{false};

    [[nodiscard]] std::shared_ptr<concurrency::ExecutionTask> find(const std::string& executionId) const;

    void complete(const std::shared_ptr<concurrency::ExecutionTask>& task);
    void onTerminal(const types::Execution& execution);
};

}
