#include "engine/ProgressTracker.hpp"

#include <algorithm>

using namespace bh::engine;
using namespace bh::types;
using namespace std::chrono;

ProgressTracker::ProgressTracker(Clock clock, const milliseconds window)
    : clock_(std::move(clock)), window_(window) {
    if (!clock_) throw std::invalid_argument("ProgressTracker requires a clock");
    if (window_.count() <= 0) throw std::invalid_argument("Rate window must be positive");
}

std::shared_ptr<ProgressTracker::Entry> ProgressTracker::find(const std::string& executionId) const {
    std::shared_lock lock(mapMutex_);
    const auto it = entries_.find(executionId);
    return it != entries_.end() ? it->second : nullptr;
}

void ProgressTracker::track(const std::string& executionId) {
    auto entry = std::make_shared<Entry>();
    entry->working.execution_id = executionId;
    entry->working.phase = ProgressSnapshot::Phase::QUEUED;
    publish(*entry);

    std::unique_lock lock(mapMutex_);
    entries_.try_emplace(executionId, std::move(entry));
}

void ProgressTracker::startAttempt(const std::string& executionId, const unsigned int attempt) {
    update(executionId, [&](Entry& e) {
        e.working.attempt = attempt;
        e.working.phase = ProgressSnapshot::Phase::PREFLIGHT;
        e.working.rate_bytes_per_sec = 0.0;
        e.working.eta_seconds.reset();
        e.samples.clear();
    });
}

void ProgressTracker::beginTransfer(const std::string& executionId, const uint64_t bytesTotal,
                                    const uint64_t resumeOffset, const std::size_t filesTotal,
                                    const std::size_t filesDone) {
    update(executionId, [&](Entry& e) {
        auto& s = e.working;
        s.phase = ProgressSnapshot::Phase::TRANSFERRING;
        s.bytes_total = bytesTotal;
        s.bytes_done = std::min(resumeOffset, bytesTotal);
        s.files_total = filesTotal;
        s.files_done = filesDone;
        s.current_file.clear();
        s.rate_bytes_per_sec = 0.0;
        s.eta_seconds.reset();
        e.samples.clear();
        e.samples.push_back({clock_(), s.bytes_done});
        if (s.bytes_total > 0 && s.bytes_done >= s.bytes_total) s.eta_seconds = 0.0;
    });
}

void ProgressTracker::setPhase(const std::string& executionId, const ProgressSnapshot::Phase phase) {
    update(executionId, [&](Entry& e) {
        e.working.phase = phase;
        if (phase != ProgressSnapshot::Phase::TRANSFERRING) {
            e.working.rate_bytes_per_sec = 0.0;
            if (e.working.bytes_total == 0 || e.working.bytes_done < e.working.bytes_total)
                e.working.eta_seconds.reset();
        }
    });
}

void ProgressTracker::setCurrentFile(const std::string& executionId, const std::string& file,
                                     const std::size_t filesDone) {
    update(executionId, [&](Entry& e) {
        e.working.current_file = file;
        e.working.files_done = std::max(e.working.files_done, filesDone);
    });
}

void ProgressTracker::record(const std::string& executionId, const TransferUnit& unit) {
    if (!unit.success) return;

    update(executionId, [&](Entry& e) {
        auto& s = e.working;
        if (s.phase == ProgressSnapshot::Phase::FINISHED) return;
        s.bytes_done = std::max(s.bytes_done, std::min(unit.end(), s.bytes_total));
        e.samples.push_back({clock_(), s.bytes_done});
        recomputeRate(e);
    });
}

void ProgressTracker::finish(const std::string& executionId) {
    update(executionId, [&](Entry& e) {
        auto& s = e.working;
        s.phase = ProgressSnapshot::Phase::FINISHED;
        s.current_file.clear();
        s.rate_bytes_per_sec = 0.0;
        if (s.bytes_total > 0 && s.bytes_done >= s.bytes_total) s.eta_seconds = 0.0;
        else s.eta_seconds.reset();
        e.samples.clear();
    });
}

std::optional<ProgressSnapshot> ProgressTracker::snapshot(const std::string& executionId) const {
    const auto entry = find(executionId);
    if (!entry) return std::nullopt;
    const auto published = entry->published.load(std::memory_order_acquire);
    if (!published) return std::nullopt;
    return *published;
}

void ProgressTracker::forget(const std::string& executionId) {
    std::unique_lock lock(mapMutex_);
    entries_.erase(executionId);
}

void ProgressTracker::recomputeRate(Entry& entry) const {
    auto& s = entry.working;
    auto& samples = entry.samples;
    if (samples.empty()) return;

    const auto now = samples.back().at;
    const auto cutoff = now - window_;

    // Keep the newest sample at or before the cutoff as the window's base
    while (samples.size() >= 2 && samples[1].at <= cutoff) samples.pop_front();

    const auto& base = samples.front();
    const auto elapsed = duration<double>(now - base.at).count();

    s.rate_bytes_per_sec = elapsed > 0.0
                               ? static_cast<double>(s.bytes_done - base.bytes) / elapsed
                               : 0.0;

    if (s.bytes_total > 0 && s.bytes_done >= s.bytes_total) s.eta_seconds = 0.0;
    else if (s.rate_bytes_per_sec > 0.0)
        s.eta_seconds = static_cast<double>(s.bytes_total - s.bytes_done) / s.rate_bytes_per_sec;
    else s.eta_seconds.reset();
}

void ProgressTracker::publish(Entry& entry) const {
    auto& s = entry.working;
    s.percent = s.bytes_total > 0
                    ? static_cast<double>(s.bytes_done) * 100.0 / static_cast<double>(s.bytes_total)
                    : 0.0;
    entry.published.store(std::make_shared<const ProgressSnapshot>(s), std::memory_order_release);
}
