#pragma once

#include "services/AsyncService.hpp"
#include "types/JobSpec.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace bh::services {

class WorkerPool;

// Submits scheduled jobs to a WorkerPool when they come due. One-shot jobs
// are dropped after firing; recurring jobs are pushed back at their next run.
class JobScheduler final : public AsyncService {
public:
    using time_point = std::chrono::system_clock::time_point;

    explicit JobScheduler(std::shared_ptr<WorkerPool> pool);
    ~JobScheduler() override;

    // Throws std::invalid_argument when the job carries no schedule
    void add(const types::JobSpec& spec);

    void stop() override;

    // Jobs still waiting to fire, including one being submitted right now
    [[nodiscard]] std::size_t scheduledCount() const;

    // Execution ids created by this scheduler, in firing order
    [[nodiscard]] std::vector<std::string> firedExecutions() const;

protected:
    void runLoop() override;

private:
    struct Entry {
        types::JobSpec spec;
        time_point next_run;
    };

    struct EntryCompare {
        bool operator()(const Entry& a, const Entry& b) const {
            return a.next_run > b.next_run; // Min-heap based on next_run time
        }
    };

    std::shared_ptr<WorkerPool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, EntryCompare> pq_;
    std::vector<std::string> fired_;
    std::size_t firing_{0};

    void fire(const Entry& entry);
};

}
