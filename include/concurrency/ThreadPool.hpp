#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace bh::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::string name = "ThreadPool");

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Stops accepting work, lets the workers drain the queue and joins them
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] bool stopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
