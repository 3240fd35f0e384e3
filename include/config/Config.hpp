#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace bh::config {

constexpr static uint64_t DEFAULT_CHUNK_SIZE = 8192;
constexpr static uint64_t DEFAULT_MIN_FREE_SPACE = static_cast<uint64_t>(1) * 1024 * 1024 * 1024; // 1GiB
constexpr static unsigned int DEFAULT_MAX_CONCURRENT_JOBS = 3;
constexpr static unsigned int DEFAULT_RETRY_ATTEMPTS = 3;
constexpr static std::chrono::seconds DEFAULT_RETRY_DELAY{5};
constexpr static std::chrono::seconds DEFAULT_EXECUTION_TIMEOUT{3600};
constexpr static std::size_t DEFAULT_RETAINED_EXECUTIONS = 1000;

struct EngineConfig {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint64_t min_free_space = DEFAULT_MIN_FREE_SPACE;
    unsigned int max_concurrent_jobs = DEFAULT_MAX_CONCURRENT_JOBS;
    std::chrono::seconds execution_timeout = DEFAULT_EXECUTION_TIMEOUT;
    unsigned int retry_attempts = DEFAULT_RETRY_ATTEMPTS;
    std::chrono::seconds retry_delay = DEFAULT_RETRY_DELAY;

    // Terminal executions kept queryable; the oldest are evicted first
    std::size_t retained_executions = DEFAULT_RETAINED_EXECUTIONS;

    void validate() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum backhaul  = spdlog::level::info;   // Startup, shutdown, CLI
    spdlog::level::level_enum dispatch  = spdlog::level::info;   // Admission, cancellation, requeue
    spdlog::level::level_enum worker    = spdlog::level::info;   // State transitions and retries
    spdlog::level::level_enum transfer  = spdlog::level::warn;   // Chunk I/O failures
    spdlog::level::level_enum preflight = spdlog::level::info;   // Space and access rejections
    spdlog::level::level_enum progress  = spdlog::level::warn;
    spdlog::level::level_enum config    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/backhaul";
    LogLevelsConfig levels;
};

struct Config {
    EngineConfig engine;
    LoggingConfig logging;
};

// Throws YAML::Exception on malformed input and std::invalid_argument on
// unknown keys or out-of-range values. A missing file yields defaults.
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const EngineConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
