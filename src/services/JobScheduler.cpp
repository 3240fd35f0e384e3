#include "services/JobScheduler.hpp"
#include "services/WorkerPool.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>

using namespace bh::services;
using namespace bh::types;
using namespace bh::logging;
using namespace std::chrono;

JobScheduler::JobScheduler(std::shared_ptr<WorkerPool> pool)
    : AsyncService("JobScheduler"), pool_(std::move(pool)) {
    if (!pool_) throw std::invalid_argument("JobScheduler requires a worker pool");
}

JobScheduler::~JobScheduler() {
    stop();
}

void JobScheduler::add(const JobSpec& spec) {
    if (!spec.schedule) throw std::invalid_argument("Job '" + spec.id + "' has no schedule");
    spec.validate();

    const auto first = spec.schedule->firstRun(system_clock::now());
    if (!first) {
        LogRegistry::dispatch()->warn("[JobScheduler] Job '{}' has no future run, ignoring", spec.id);
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        pq_.push({spec, *first});
    }
    cv_.notify_all();

    LogRegistry::dispatch()->info("[JobScheduler] Scheduled job '{}' ({}) for {}",
                                  spec.id, std::string(Schedule::toString(spec.schedule->type)),
                                  util::timestampToString(*first));
}

void JobScheduler::stop() {
    {
        std::scoped_lock lock(mutex_);
        interruptFlag_.store(true);
    }
    cv_.notify_all();
    AsyncService::stop();
}

std::size_t JobScheduler::scheduledCount() const {
    std::scoped_lock lock(mutex_);
    return pq_.size() + firing_;
}

std::vector<std::string> JobScheduler::firedExecutions() const {
    std::scoped_lock lock(mutex_);
    return fired_;
}

void JobScheduler::runLoop() {
    while (!interruptFlag_.load()) {
        Entry due;
        {
            std::unique_lock lock(mutex_);
            if (interruptFlag_.load()) break;

            if (pq_.empty()) {
                cv_.wait(lock);
                continue;
            }

            if (const auto wake = pq_.top().next_run; wake > system_clock::now()) {
                cv_.wait_until(lock, wake);
                continue;
            }

            due = pq_.top();
            pq_.pop();
            ++firing_;
        }

        fire(due);

        // Runs missed while the process was down or busy are skipped, not replayed
        const auto next = due.spec.schedule->nextAfter(std::max(due.next_run, system_clock::now()));
        {
            std::scoped_lock lock(mutex_);
            --firing_;
            if (next) pq_.push({due.spec, *next});
        }

        if (!next) {
            LogRegistry::dispatch()->debug("[JobScheduler] Job '{}' has no further runs", due.spec.id);
            continue;
        }

        LogRegistry::dispatch()->info("[JobScheduler] Next run of '{}' at {}", due.spec.id, util::timestampToString(*next));
    }
}

void JobScheduler::fire(const Entry& entry) {
    try {
        const auto executionId = pool_->submit(entry.spec);
        std::scoped_lock lock(mutex_);
        fired_.push_back(executionId);
    } catch (const std::exception& e) {
        LogRegistry::dispatch()->error("[JobScheduler] Failed to submit scheduled job '{}': {}", entry.spec.id, e.what());
    }
}
