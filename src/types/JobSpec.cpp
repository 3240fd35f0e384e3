#include "types/JobSpec.hpp"
#include "config/config_yaml.hpp"
#include "util/timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

using namespace bh::types;
using namespace bh::config;
using namespace std::chrono;

namespace {

Schedule parseSchedule(const YAML::Node& node) {
    rejectUnknownKeys(node, {"type", "time", "day", "days", "at"}, "job.schedule");

    Schedule s;
    const auto type = node["type"].as<std::string>("once");
    if (!Schedule::tryParseType(type, s.type)) throw std::invalid_argument("Unknown schedule type: " + type);

    if (const auto time = node["time"]) {
        const auto str = time.as<std::string>();
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%H:%M");
        if (ss.fail() || ss.peek() != std::char_traits<char>::eof())
            throw std::invalid_argument("schedule time must be HH:MM, got '" + str + "'");
        s.hour = static_cast<unsigned int>(tm.tm_hour);
        s.minute = static_cast<unsigned int>(tm.tm_min);
    }

    s.day = node["day"].as<unsigned int>(1);

    if (const auto days = node["days"]) {
        if (!days.IsSequence()) throw std::invalid_argument("schedule days must be a list of weekday names");
        for (const auto& d : days) {
            const auto name = d.as<std::string>();
            std::chrono::weekday wd;
            if (!Schedule::tryParseWeekday(name, wd)) throw std::invalid_argument("Unknown day of week: " + name);
            s.weekdays.push_back(wd);
        }
    }
    if (const auto at = node["at"]) s.at = system_clock::from_time_t(bh::util::parseTimestampFromString(at.as<std::string>()));

    s.validate();
    return s;
}

JobSpec fromNode(const YAML::Node& root, const EngineConfig& defaults) {
    if (!root || !root.IsMap()) throw std::invalid_argument("Job definition must be a YAML mapping");

    rejectUnknownKeys(root, {"id", "name", "job_type", "sources", "destination", "chunk_size", "min_free_space",
                             "retry_attempts", "retry_delay_seconds", "execution_timeout_seconds",
                             "checksum_chunks", "schedule"}, "job");

    JobSpec spec(defaults);
    spec.id = root["id"].as<std::string>("");
    spec.name = root["name"].as<std::string>(spec.id);

    if (const auto type = root["job_type"]) {
        const auto str = type.as<std::string>();
        if (!JobSpec::tryParseType(str, spec.type)) throw std::invalid_argument("Unknown job type: " + str);
    }

    if (const auto sources = root["sources"]) {
        if (sources.IsScalar()) spec.sources.emplace_back(sources.as<std::string>());
        else for (const auto& s : sources) spec.sources.emplace_back(s.as<std::string>());
    }

    spec.destination = root["destination"].as<std::string>("");
    spec.chunk_size = root["chunk_size"].as<uint64_t>(spec.chunk_size);
    spec.min_free_space = root["min_free_space"].as<uint64_t>(spec.min_free_space);
    spec.max_retry_attempts = root["retry_attempts"].as<unsigned int>(spec.max_retry_attempts);
    if (const auto d = root["retry_delay_seconds"]) spec.retry_delay = seconds(d.as<int64_t>());
    if (const auto t = root["execution_timeout_seconds"]) spec.execution_timeout = seconds(t.as<int64_t>());
    spec.checksum_chunks = root["checksum_chunks"].as<bool>(false);

    if (const auto schedule = root["schedule"]) spec.schedule = parseSchedule(schedule);

    spec.validate();
    return spec;
}

}

JobSpec::JobSpec(const EngineConfig& defaults)
    : chunk_size(defaults.chunk_size),
      min_free_space(defaults.min_free_space),
      max_retry_attempts(defaults.retry_attempts),
      retry_delay(defaults.retry_delay),
      execution_timeout(defaults.execution_timeout) {}

void JobSpec::validate() const {
    if (id.empty()) throw std::invalid_argument("Job id must not be empty");
    if (sources.empty()) throw std::invalid_argument("Job '" + id + "' has no sources");
    for (const auto& s : sources)
        if (s.empty()) throw std::invalid_argument("Job '" + id + "' has an empty source path");
    if (destination.empty()) throw std::invalid_argument("Job '" + id + "' has no destination");
    if (chunk_size == 0) throw std::invalid_argument("Job '" + id + "' chunk_size must be greater than zero");
    if (retry_delay.count() < 0) throw std::invalid_argument("Job '" + id + "' retry delay must not be negative");
    if (execution_timeout.count() <= 0) throw std::invalid_argument("Job '" + id + "' timeout must be positive");
    if (schedule) schedule->validate();
}

std::string_view JobSpec::toString(const Type t) noexcept {
    switch (t) {
        case Type::FULL: return "full";
        case Type::INCREMENTAL: return "incremental";
        default: return "unknown";
    }
}

bool JobSpec::tryParseType(const std::string_view in, Type& out) noexcept {
    if (in == "full") out = Type::FULL;
    else if (in == "incremental") out = Type::INCREMENTAL;
    else return false;
    return true;
}

JobSpec bh::types::parseJobSpec(const std::string& yaml, const EngineConfig& defaults) {
    return fromNode(YAML::Load(yaml), defaults);
}

JobSpec bh::types::loadJobSpec(const std::filesystem::path& path, const EngineConfig& defaults) {
    return fromNode(YAML::LoadFile(path.string()), defaults);
}

void bh::types::to_json(nlohmann::json& j, const JobSpec& spec) {
    std::vector<std::string> sources;
    sources.reserve(spec.sources.size());
    for (const auto& s : spec.sources) sources.push_back(s.string());

    j = {
        {"id", spec.id},
        {"name", spec.name},
        {"job_type", std::string(JobSpec::toString(spec.type))},
        {"sources", sources},
        {"destination", spec.destination.string()},
        {"chunk_size", spec.chunk_size},
        {"min_free_space", spec.min_free_space},
        {"retry_attempts", spec.max_retry_attempts},
        {"retry_delay_ms", spec.retry_delay.count()},
        {"execution_timeout_ms", spec.execution_timeout.count()},
        {"checksum_chunks", spec.checksum_chunks}
    };
    if (spec.schedule) j["schedule"] = *spec.schedule;
}
