#include <gtest/gtest.h>
#include "engine/ProgressTracker.hpp"

#include <thread>

using namespace bh::engine;
using namespace bh::types;
using namespace std::chrono;

using Phase = ProgressSnapshot::Phase;

class ProgressTrackerTest : public ::testing::Test {
protected:
    steady_clock::time_point now = steady_clock::time_point{} + hours(1);
    ProgressTracker tracker{[this] { return now; }};
    const std::string id = "exec-1";

    void SetUp() override {
        tracker.track(id);
    }

    static TransferUnit unit(const uint64_t offset, const uint64_t length, const bool success = true) {
        TransferUnit u;
        u.offset = offset;
        u.length = length;
        u.success = success;
        return u;
    }
};

TEST_F(ProgressTrackerTest, StartsQueued) {
    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->phase, Phase::QUEUED);
    EXPECT_EQ(s->bytes_done, 0u);
    EXPECT_FALSE(s->eta_seconds.has_value());
}

TEST_F(ProgressTrackerTest, UnknownExecutionHasNoSnapshot) {
    EXPECT_FALSE(tracker.snapshot("nope").has_value());
}

TEST_F(ProgressTrackerTest, RateOverTrailingFiveSeconds) {
    tracker.startAttempt(id, 1);
    tracker.beginTransfer(id, 100000, 0, 1, 0);

    for (int i = 1; i <= 10; ++i) {
        now += seconds(1);
        tracker.record(id, unit((i - 1) * 5000, 5000));
    }

    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->phase, Phase::TRANSFERRING);
    EXPECT_EQ(s->bytes_done, 50000u);
    EXPECT_DOUBLE_EQ(s->percent, 50.0);
    EXPECT_DOUBLE_EQ(s->rate_bytes_per_sec, 5000.0);
    ASSERT_TRUE(s->eta_seconds.has_value());
    EXPECT_DOUBLE_EQ(*s->eta_seconds, 10.0);
}

TEST_F(ProgressTrackerTest, RateIgnoresSamplesOlderThanWindow) {
    tracker.beginTransfer(id, 1000000, 0, 1, 0);

    // Burst then stall: the rate runs from the newest sample at or before the window start
    now += seconds(1);
    tracker.record(id, unit(0, 500000));
    now += seconds(9);
    tracker.record(id, unit(500000, 10000));

    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->rate_bytes_per_sec, 10000.0 / 9.0);
}

TEST_F(ProgressTrackerTest, YoungAttemptUsesAttemptStart) {
    tracker.beginTransfer(id, 100000, 0, 1, 0);
    now += milliseconds(500);
    tracker.record(id, unit(0, 8192));

    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->rate_bytes_per_sec, 16384.0);
}

TEST_F(ProgressTrackerTest, EtaUnknownWhileRateIsZero) {
    tracker.beginTransfer(id, 100000, 0, 1, 0);
    tracker.record(id, unit(0, 8192)); // no time has passed

    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->rate_bytes_per_sec, 0.0);
    EXPECT_FALSE(s->eta_seconds.has_value());
}

TEST_F(ProgressTrackerTest, BytesDoneNeverDecreasesWithinAttempt) {
    tracker.beginTransfer(id, 100000, 0, 1, 0);
    now += seconds(1);
    tracker.record(id, unit(0, 20000));
    now += seconds(1);
    tracker.record(id, unit(0, 10000));
    tracker.record(id, unit(20000, 8192, false));

    EXPECT_EQ(tracker.snapshot(id)->bytes_done, 20000u);
}

TEST_F(ProgressTrackerTest, RetryRestartsAtResumeOffset) {
    tracker.startAttempt(id, 1);
    tracker.beginTransfer(id, 100000, 0, 1, 0);
    now += seconds(1);
    tracker.record(id, unit(0, 48000));

    tracker.setPhase(id, Phase::RETRYING);
    EXPECT_EQ(tracker.snapshot(id)->phase, Phase::RETRYING);
    EXPECT_EQ(tracker.snapshot(id)->rate_bytes_per_sec, 0.0);

    tracker.startAttempt(id, 2);
    EXPECT_EQ(tracker.snapshot(id)->phase, Phase::PREFLIGHT);
    EXPECT_EQ(tracker.snapshot(id)->attempt, 2u);

    tracker.beginTransfer(id, 100000, 40000, 1, 0);
    const auto s = tracker.snapshot(id);
    EXPECT_EQ(s->bytes_done, 40000u);
    EXPECT_DOUBLE_EQ(s->percent, 40.0);
}

TEST_F(ProgressTrackerTest, FinishedSnapshotIsKept) {
    tracker.beginTransfer(id, 1000, 0, 1, 0);
    now += seconds(1);
    tracker.record(id, unit(0, 1000));
    tracker.finish(id);

    const auto s = tracker.snapshot(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->phase, Phase::FINISHED);
    EXPECT_EQ(s->bytes_done, 1000u);
    EXPECT_DOUBLE_EQ(s->percent, 100.0);
    ASSERT_TRUE(s->eta_seconds.has_value());
    EXPECT_EQ(*s->eta_seconds, 0.0);

    tracker.record(id, unit(0, 10));
    EXPECT_EQ(tracker.snapshot(id)->bytes_done, 1000u);
}

TEST_F(ProgressTrackerTest, CurrentFileAndCounts) {
    tracker.beginTransfer(id, 300, 0, 3, 0);
    tracker.setCurrentFile(id, "/data/b.txt", 1);

    const auto s = tracker.snapshot(id);
    EXPECT_EQ(s->current_file, "/data/b.txt");
    EXPECT_EQ(s->files_done, 1u);
    EXPECT_EQ(s->files_total, 3u);
}

TEST(ProgressTrackerConcurrencyTest, ReadersNeverSeeTornSnapshots) {
    ProgressTracker tracker;
    const std::string id = "exec-rw";
    constexpr uint64_t total = 8192 * 2000;

    tracker.track(id);
    tracker.beginTransfer(id, total, 0, 1, 0);

    std::atomic<bool> done{false};
    std::atomic<unsigned int> violations{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            uint64_t last = 0;
            while (!done.load()) {
                const auto s = tracker.snapshot(id);
                if (!s) { ++violations; continue; }
                const double expected = static_cast<double>(s->bytes_done) * 100.0 / static_cast<double>(s->bytes_total);
                if (s->bytes_total != total || s->bytes_done < last || s->percent != expected) ++violations;
                last = s->bytes_done;
            }
        });
    }

    for (uint64_t off = 0; off < total; off += 8192) {
        TransferUnit u;
        u.offset = off;
        u.length = 8192;
        tracker.record(id, u);
    }

    done.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(violations.load(), 0u);
    EXPECT_EQ(tracker.snapshot(id)->bytes_done, total);
}
