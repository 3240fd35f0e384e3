#pragma once

#include "config/Config.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace bh::config {

// Extra options are an error, never silently ignored.
inline void rejectUnknownKeys(const YAML::Node& node,
                              const std::initializer_list<std::string_view> allowed,
                              const std::string_view section) {
    if (!node.IsMap()) throw std::invalid_argument(std::string(section) + " must be a mapping");
    for (const auto& kv : node) {
        const auto key = kv.first.as<std::string>();
        bool known = false;
        for (const auto& a : allowed) if (a == key) { known = true; break; }
        if (!known) throw std::invalid_argument("Unknown option '" + key + "' in " + std::string(section));
    }
}

inline spdlog::level::level_enum parseLevel(const YAML::Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto str = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(str);
    // from_str maps anything unrecognised to "off"
    if (lvl == spdlog::level::off && str != "off") throw std::invalid_argument("Unknown log level: " + str);
    return lvl;
}

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

}

namespace YAML {

using namespace bh::config;

template<>
struct convert<EngineConfig> {
    static Node encode(const EngineConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        node["min_free_space"] = rhs.min_free_space;
        node["max_concurrent_jobs"] = rhs.max_concurrent_jobs;
        node["execution_timeout_seconds"] = static_cast<int64_t>(rhs.execution_timeout.count());
        node["retry_attempts"] = rhs.retry_attempts;
        node["retry_delay_seconds"] = static_cast<int64_t>(rhs.retry_delay.count());
        node["retained_executions"] = rhs.retained_executions;
        return node;
    }

    static bool decode(const Node& node, EngineConfig& rhs) {
        if (!node.IsMap()) return false;
        rejectUnknownKeys(node, {"chunk_size", "min_free_space", "max_concurrent_jobs",
                                 "execution_timeout_seconds", "retry_attempts", "retry_delay_seconds",
                                 "retained_executions"}, "engine");
        rhs.chunk_size = node["chunk_size"].as<uint64_t>(DEFAULT_CHUNK_SIZE);
        rhs.min_free_space = node["min_free_space"].as<uint64_t>(DEFAULT_MIN_FREE_SPACE);
        rhs.max_concurrent_jobs = node["max_concurrent_jobs"].as<unsigned int>(DEFAULT_MAX_CONCURRENT_JOBS);
        rhs.execution_timeout = std::chrono::seconds(
            node["execution_timeout_seconds"].as<int64_t>(DEFAULT_EXECUTION_TIMEOUT.count()));
        rhs.retry_attempts = node["retry_attempts"].as<unsigned int>(DEFAULT_RETRY_ATTEMPTS);
        rhs.retry_delay = std::chrono::seconds(node["retry_delay_seconds"].as<int64_t>(DEFAULT_RETRY_DELAY.count()));
        rhs.retained_executions = node["retained_executions"].as<std::size_t>(DEFAULT_RETAINED_EXECUTIONS);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["backhaul"]  = to_std_string(spdlog::level::to_string_view(rhs.backhaul));
        node["dispatch"]  = to_std_string(spdlog::level::to_string_view(rhs.dispatch));
        node["worker"]    = to_std_string(spdlog::level::to_string_view(rhs.worker));
        node["transfer"]  = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["preflight"] = to_std_string(spdlog::level::to_string_view(rhs.preflight));
        node["progress"]  = to_std_string(spdlog::level::to_string_view(rhs.progress));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rejectUnknownKeys(node, {"backhaul", "dispatch", "worker", "transfer", "preflight", "progress", "config"},
                          "logging.subsystem_levels");
        const SubsystemLogLevelsConfig def;
        rhs.backhaul = parseLevel(node["backhaul"], def.backhaul);
        rhs.dispatch = parseLevel(node["dispatch"], def.dispatch);
        rhs.worker = parseLevel(node["worker"], def.worker);
        rhs.transfer = parseLevel(node["transfer"], def.transfer);
        rhs.preflight = parseLevel(node["preflight"], def.preflight);
        rhs.progress = parseLevel(node["progress"], def.progress);
        rhs.config = parseLevel(node["config"], def.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rejectUnknownKeys(node, {"console_log_level", "file_log_level", "subsystem_levels"}, "logging.levels");
        rhs.console_log_level = parseLevel(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = parseLevel(node["file_log_level"], spdlog::level::debug);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rejectUnknownKeys(node, {"log_dir", "levels"}, "logging");
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/backhaul");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
