#include <gtest/gtest.h>
#include "types/JobSpec.hpp"
#include "types/Execution.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace bh::types;
using namespace bh::config;
using namespace std::chrono;

TEST(JobSpecTest, ParsesFullDefinition) {
    const auto spec = parseJobSpec(R"(
id: nightly-docs
name: Nightly documents
sources:
  - /srv/docs
  - /srv/notes.txt
destination: /backup/docs
chunk_size: 65536
min_free_space: 2048
retry_attempts: 5
retry_delay_seconds: 10
execution_timeout_seconds: 120
checksum_chunks: true
schedule:
  type: daily
  time: "02:30"
)", EngineConfig{});

    EXPECT_EQ(spec.id, "nightly-docs");
    EXPECT_EQ(spec.name, "Nightly documents");
    ASSERT_EQ(spec.sources.size(), 2u);
    EXPECT_EQ(spec.sources[1], "/srv/notes.txt");
    EXPECT_EQ(spec.destination, "/backup/docs");
    EXPECT_EQ(spec.chunk_size, 65536u);
    EXPECT_EQ(spec.min_free_space, 2048u);
    EXPECT_EQ(spec.max_retry_attempts, 5u);
    EXPECT_EQ(spec.retry_delay, seconds(10));
    EXPECT_EQ(spec.execution_timeout, seconds(120));
    EXPECT_TRUE(spec.checksum_chunks);
    ASSERT_TRUE(spec.schedule.has_value());
    EXPECT_EQ(spec.schedule->type, Schedule::Type::DAILY);
    EXPECT_EQ(spec.schedule->hour, 2u);
    EXPECT_EQ(spec.schedule->minute, 30u);
}

TEST(JobSpecTest, MissingOptionsComeFromEngineDefaults) {
    EngineConfig engine;
    engine.chunk_size = 4096;
    engine.retry_delay = seconds(1);

    const auto spec = parseJobSpec("id: a\nsources: /srv/a\ndestination: /backup/a\n", engine);

    ASSERT_EQ(spec.sources.size(), 1u);
    EXPECT_EQ(spec.name, "a");
    EXPECT_EQ(spec.chunk_size, 4096u);
    EXPECT_EQ(spec.min_free_space, DEFAULT_MIN_FREE_SPACE);
    EXPECT_EQ(spec.max_retry_attempts, 3u);
    EXPECT_EQ(spec.retry_delay, seconds(1));
    EXPECT_EQ(spec.execution_timeout, seconds(3600));
    EXPECT_FALSE(spec.schedule.has_value());
}

TEST(JobSpecTest, RejectsUnknownKeys) {
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\ncompress: true\n", EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  every: 5\n", EngineConfig{}),
                 std::invalid_argument);
}

TEST(JobSpecTest, RejectsIncompleteDefinitions) {
    EXPECT_THROW(parseJobSpec("sources: /a\ndestination: /b\n", EngineConfig{}), std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\ndestination: /b\n", EngineConfig{}), std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\n", EngineConfig{}), std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nchunk_size: 0\n", EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("- not a mapping\n", EngineConfig{}), std::invalid_argument);
}

TEST(JobSpecTest, RejectsBadSchedules) {
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: hourly\n", EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: daily\n  time: noon\n",
                              EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: daily\n  time: \"25:00\"\n",
                              EngineConfig{}),
                 std::invalid_argument);
}

TEST(JobSpecTest, ScheduleTimeMustBeExact) {
    const auto withTime = [](const std::string& time) {
        return parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: daily\n  time: \"" + time + "\"\n",
                            EngineConfig{});
    };

    EXPECT_THROW(withTime("10:30xyz"), std::invalid_argument);
    EXPECT_THROW(withTime("10:"), std::invalid_argument);

    const auto spec = withTime("07:05");
    ASSERT_TRUE(spec.schedule.has_value());
    EXPECT_EQ(spec.schedule->hour, 7u);
    EXPECT_EQ(spec.schedule->minute, 5u);
}

TEST(JobSpecTest, JobTypeAndWeekdays) {
    const auto spec = parseJobSpec(R"(
id: a
job_type: incremental
sources: /a
destination: /b
schedule:
  type: daily
  time: "01:00"
  days: [monday, friday]
)", EngineConfig{});

    EXPECT_EQ(spec.type, JobSpec::Type::INCREMENTAL);
    ASSERT_TRUE(spec.schedule.has_value());
    EXPECT_EQ(spec.schedule->weekdays, (std::vector<weekday>{Monday, Friday}));

    const nlohmann::json j = spec;
    EXPECT_EQ(j["job_type"], "incremental");
    EXPECT_EQ(j["schedule"]["days"][1], "friday");

    EXPECT_EQ(parseJobSpec("id: a\nsources: /a\ndestination: /b\n", EngineConfig{}).type, JobSpec::Type::FULL);
    EXPECT_THROW(parseJobSpec("id: a\njob_type: differential\nsources: /a\ndestination: /b\n", EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: daily\n  days: [someday]\n",
                              EngineConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(parseJobSpec("id: a\nsources: /a\ndestination: /b\nschedule:\n  type: monthly\n  days: [monday]\n",
                              EngineConfig{}),
                 std::invalid_argument);
}

TEST(JobSpecTest, JsonView) {
    JobSpec spec;
    spec.id = "a";
    spec.name = "A";
    spec.sources = {"/srv/a"};
    spec.destination = "/backup";

    const nlohmann::json j = spec;
    EXPECT_EQ(j["id"], "a");
    EXPECT_EQ(j["sources"][0], "/srv/a");
    EXPECT_EQ(j["chunk_size"], 8192);
    EXPECT_EQ(j["retry_delay_ms"], 5000);
    EXPECT_FALSE(j.contains("schedule"));
}

TEST(ExecutionTest, TerminalStatesAndNames) {
    EXPECT_FALSE(Execution::isTerminal(Execution::State::PENDING));
    EXPECT_FALSE(Execution::isTerminal(Execution::State::RETRYING));
    EXPECT_FALSE(Execution::isTerminal(Execution::State::CANCELLING));
    EXPECT_TRUE(Execution::isTerminal(Execution::State::SUCCEEDED));
    EXPECT_TRUE(Execution::isTerminal(Execution::State::TIMED_OUT));

    Execution::State s{};
    EXPECT_TRUE(Execution::tryParseState("timed_out", s));
    EXPECT_EQ(s, Execution::State::TIMED_OUT);
    EXPECT_FALSE(Execution::tryParseState("exploded", s));
}

TEST(ExecutionTest, JsonCarriesFailureClass) {
    Execution e;
    e.id = "x";
    e.job_id = "a";
    e.state = Execution::State::FAILED;
    e.error = Failure{Failure::Kind::INSUFFICIENT_SPACE, "no room"};

    const nlohmann::json j = e;
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["error"]["kind"], "PreflightFailure");
    EXPECT_EQ(j["error"]["cause"], "insufficient_space");
    EXPECT_EQ(j["error"]["message"], "no room");
    EXPECT_TRUE(j["start_time"].is_null());
}
