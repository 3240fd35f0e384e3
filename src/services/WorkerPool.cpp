#include "services/WorkerPool.hpp"
#include "services/Collaborators.hpp"
#include "concurrency/ExecutionTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "engine/Preflight.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/ReservationLedger.hpp"
#include "engine/RetryPolicy.hpp"
#include "storage/Volume.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <ranges>
#include <fmt/core.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace bh::services;
using namespace bh::concurrency;
using namespace bh::engine;
using namespace bh::types;
using namespace bh::logging;
using namespace std::chrono;

namespace {

std::string generateExecutionId() {
    static boost::uuids::random_generator generator;
    const boost::uuids::uuid uuid = generator();
    return boost::uuids::to_string(uuid);
}

}

// Runs one admitted attempt and hands the slot back however the attempt ends
struct WorkerPool::Admission final : Task {
    WorkerPool& pool;
    std::shared_ptr<ExecutionTask> task;

    Admission(WorkerPool& p, std::shared_ptr<ExecutionTask> t) : pool(p), task(std::move(t)) {}

    void operator()() override {
        struct SlotGuard {
            WorkerPool& pool;
            const std::shared_ptr<ExecutionTask>& task;
            ~SlotGuard() { pool.complete(task); }
        } guard{pool, task};

        (*task)();
    }
};

WorkerPool::WorkerPool(config::EngineConfig config, Collaborators collaborators)
    : AsyncService("WorkerPool"),
      config_(std::move(config)),
      collaborators_(std::move(collaborators)) {
    config_.validate();

    if (!collaborators_.store) collaborators_.store = std::make_shared<LogExecutionStore>();
    if (!collaborators_.notifier) collaborators_.notifier = std::make_shared<AuditOutcomeNotifier>();
    if (!collaborators_.ledger) collaborators_.ledger = std::make_shared<InProcessReservationLedger>();
    if (!collaborators_.volume) collaborators_.volume = std::make_shared<storage::LocalVolume>();
    if (!collaborators_.retryPolicy) collaborators_.retryPolicy = std::make_shared<FixedDelayRetryPolicy>();

    tracker_ = std::make_shared<ProgressTracker>();
    preflight_ = std::make_shared<PreflightChecker>(collaborators_.volume, collaborators_.ledger);
    threads_ = std::make_unique<ThreadPool>(config_.max_concurrent_jobs, "WorkerPool");
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) throw std::runtime_error("[WorkerPool] Cannot restart a stopped pool");
    }
    AsyncService::start();
}

void WorkerPool::stop() {
    std::vector<std::shared_ptr<ExecutionTask>> waiting, inFlight;
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        interruptFlag_.store(true);

        for (const auto& task : waiting_ | std::views::values) waiting.push_back(task);
        waiting_.clear();

        for (const auto& id : active_) inFlight.push_back(tasks_.at(id));
    }
    cv_.notify_all();

    AsyncService::stop();

    for (const auto& task : waiting) task->cancelWhileWaiting();
    for (const auto& task : inFlight) task->requestCancel();

    // Drains admitted attempts; each observes its cancel token at the next chunk
    threads_->stop();

    LogRegistry::dispatch()->info("[WorkerPool] Stopped, {} executions cancelled while waiting, {} in flight",
                                  waiting.size(), inFlight.size());
}

std::string WorkerPool::submit(const JobSpec& spec) {
    spec.validate();

    Execution execution;
    execution.job_id = spec.id;
    execution.submitted_at = std::time(nullptr);

    std::shared_ptr<ExecutionTask> task;
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) throw std::runtime_error("[WorkerPool] Cannot submit to a stopped pool");

        execution.id = generateExecutionId();
        tracker_->track(execution.id);

        task = std::make_shared<ExecutionTask>(
            execution, spec,
            ExecutionDeps{collaborators_.volume, preflight_, collaborators_.retryPolicy, tracker_,
                          collaborators_.store, collaborators_.notifier,
                          [this](const Execution& e) { onTerminal(e); }});

        task->sequence = nextSequence_++;
        task->next_run = steady_clock::now();
        tasks_.emplace(execution.id, task);
    }

    task->submitted();

    {
        std::scoped_lock lock(mutex_);
        if (!task->isTerminal()) waiting_.emplace(task->sequence, task);
    }
    cv_.notify_all();

    LogRegistry::dispatch()->info("[WorkerPool] Submitted job '{}' as execution {}", spec.id, execution.id);
    return execution.id;
}

bool WorkerPool::cancel(const std::string& executionId) {
    std::shared_ptr<ExecutionTask> task;
    bool wasWaiting = false;
    {
        std::scoped_lock lock(mutex_);
        const auto it = tasks_.find(executionId);
        if (it == tasks_.end()) {
            LogRegistry::dispatch()->warn("[WorkerPool] Cancel requested for unknown execution {}", executionId);
            return false;
        }
        task = it->second;
        wasWaiting = waiting_.erase(task->sequence) > 0;
    }

    if (task->isTerminal()) return false;

    if (wasWaiting) {
        LogRegistry::dispatch()->info("[WorkerPool] Cancelling queued execution {}", executionId);
        task->cancelWhileWaiting();
        cv_.notify_all();
        return true;
    }

    LogRegistry::dispatch()->info("[WorkerPool] Cancelling running execution {}", executionId);
    return task->requestCancel();
}

std::shared_ptr<ExecutionTask> WorkerPool::find(const std::string& executionId) const {
    std::scoped_lock lock(mutex_);
    const auto it = tasks_.find(executionId);
    return it != tasks_.end() ? it->second : nullptr;
}

std::optional<ProgressSnapshot> WorkerPool::progress(const std::string& executionId) const {
    return tracker_->snapshot(executionId);
}

std::optional<Execution> WorkerPool::outcome(const std::string& executionId) const {
    const auto task = find(executionId);
    if (!task) return std::nullopt;
    auto e = task->execution();
    if (!e.isTerminal()) return std::nullopt;
    return e;
}

std::optional<Execution> WorkerPool::execution(const std::string& executionId) const {
    const auto task = find(executionId);
    if (!task) return std::nullopt;
    return task->execution();
}

std::optional<Execution> WorkerPool::awaitOutcome(const std::string& executionId, const milliseconds timeout) {
    const auto task = find(executionId);
    if (!task) return std::nullopt;

    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return task->isTerminal(); })) return std::nullopt;
    return task->execution();
}

std::vector<std::string> WorkerPool::executionIds() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(tasks_.size());
    for (const auto& id : tasks_ | std::views::keys) ids.push_back(id);
    return ids;
}

unsigned int WorkerPool::runningCount() const {
    std::scoped_lock lock(mutex_);
    return static_cast<unsigned int>(active_.size());
}

unsigned int WorkerPool::peakRunning() const {
    std::scoped_lock lock(mutex_);
    return peakRunning_;
}

std::size_t WorkerPool::pendingCount() const {
    std::scoped_lock lock(mutex_);
    return waiting_.size();
}

bool WorkerPool::idle() const {
    std::scoped_lock lock(mutex_);
    return waiting_.empty() && active_.empty();
}

void WorkerPool::runLoop() {
    while (!interruptFlag_.load()) {
        std::vector<std::shared_ptr<ExecutionTask>> expired;
        std::shared_ptr<ExecutionTask> next;

        {
            std::unique_lock lock(mutex_);
            if (interruptFlag_.load()) break;

            const auto now = steady_clock::now();

            for (auto it = waiting_.begin(); it != waiting_.end();) {
                if (it->second->deadlineExpired(now)) {
                    expired.push_back(it->second);
                    it = waiting_.erase(it);
                } else ++it;
            }

            if (expired.empty()) {
                std::optional<steady_clock::time_point> wake;
                const auto earlier = [&wake](const steady_clock::time_point t) {
                    if (!wake || t < *wake) wake = t;
                };
                const bool slotFree = active_.size() < config_.max_concurrent_jobs;

                // Retry waits expire at their deadline whether or not a slot frees up
                for (auto it = waiting_.begin(); it != waiting_.end(); ++it) {
                    const auto& task = it->second;
                    if (const auto deadline = task->deadline()) earlier(*deadline);
                    if (!slotFree) continue;

                    if (task->next_run <= now) {
                        next = task;
                        waiting_.erase(it);
                        break;
                    }
                    earlier(task->next_run);
                }

                if (!next) {
                    if (wake) cv_.wait_until(lock, *wake);
                    else cv_.wait(lock);
                    continue;
                }

                active_.insert(next->id());
                peakRunning_ = std::max(peakRunning_, static_cast<unsigned int>(active_.size()));
            }
        }

        for (const auto& task : expired) task->timeoutWhileWaiting();

        if (next) {
            LogRegistry::dispatch()->debug("[WorkerPool] Admitting {} ({} running)", next->id(), runningCount());
            try {
                threads_->submit(std::make_shared<Admission>(*this, next));
            } catch (const std::exception& e) {
                LogRegistry::dispatch()->error("[WorkerPool] Failed to admit {}: {}", next->id(), e.what());
                {
                    std::scoped_lock lock(mutex_);
                    active_.erase(next->id());
                }
                next->cancelWhileWaiting();
            }
        }
    }
}

void WorkerPool::complete(const std::shared_ptr<ExecutionTask>& task) {
    bool cancelNow = false;
    {
        std::scoped_lock lock(mutex_);
        active_.erase(task->id());

        if (task->awaitingRetry()) {
            if (stopped_ || task->cancelRequested()) cancelNow = true;
            else waiting_.emplace(task->sequence, task);
        }
    }
    cv_.notify_all();

    if (cancelNow) task->cancelWhileWaiting();
}

void WorkerPool::onTerminal(const Execution& execution) {
    std::vector<std::string> evicted;
    {
        std::scoped_lock lock(mutex_);
        retired_.push_back(execution.id);
        while (retired_.size() > config_.retained_executions) {
            evicted.push_back(retired_.front());
            tasks_.erase(retired_.front());
            retired_.pop_front();
        }
    }
    cv_.notify_all();

    for (const auto& id : evicted) tracker_->forget(id);

    LogRegistry::dispatch()->debug("[WorkerPool] {} reached {}{}", execution.id,
                                   std::string(Execution::toString(execution.state)),
                                   evicted.empty() ? std::string() : fmt::format(", evicted {} older", evicted.size()));
}
