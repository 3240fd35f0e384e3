#pragma once

#include "types/ProgressSnapshot.hpp"
#include "types/TransferUnit.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace bh::engine {

// Aggregates transfer units into per-execution snapshots. Each execution has
// a single writer (its worker); readers get the last published snapshot
// through an atomic shared_ptr load and never observe a half-applied update.
class ProgressTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::seconds RATE_WINDOW{5};

    explicit ProgressTracker(Clock clock = [] { return std::chrono::steady_clock::now(); },
                             std::chrono::milliseconds window = RATE_WINDOW);

    void track(const std::string& executionId);

    // Enters preflight for the given attempt number
    void startAttempt(const std::string& executionId, unsigned int attempt);

    // Enters transferring; bytesDone restarts at the durable resume offset
    void beginTransfer(const std::string& executionId, uint64_t bytesTotal, uint64_t resumeOffset,
                       std::size_t filesTotal, std::size_t filesDone);

    void setPhase(const std::string& executionId, types::ProgressSnapshot::Phase phase);

    void setCurrentFile(const std::string& executionId, const std::string& file, std::size_t filesDone);

    // unit offsets are positions in the execution's byte stream. Failed units are ignored.
    void record(const std::string& executionId, const types::TransferUnit& unit);

    // Freezes the snapshot in FINISHED; later reads keep returning it
    void finish(const std::string& executionId);

    [[nodiscard]] std::optional<types::ProgressSnapshot> snapshot(const std::string& executionId) const;

    void forget(const std::string& executionId);

private:
    struct Sample {
        std::chrono::steady_clock::time_point at;
        uint64_t bytes;
    };

    struct Entry {
        std::mutex writer;
        types::ProgressSnapshot working;
        std::deque<Sample> samples;
        std::atomic<std::shared_ptr<const types::ProgressSnapshot>> published;
    };

    Clock clock_;
    std::chrono::milliseconds window_;

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    [[nodiscard]] std::shared_ptr<Entry> find(const std::string& executionId) const;

    template <typename Fn>
    void update(const std::string& executionId, Fn&& fn) {
        const auto entry = find(executionId);
        if (!entry) return;
        std::scoped_lock lock(entry->writer);
        fn(*entry);
        publish(*entry);
    }

    void publish(Entry& entry) const;
    void recomputeRate(Entry& entry) const;
};

}
