#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace bh::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;

    rejectUnknownKeys(root, {"engine", "logging"}, "config");
    if (auto node = root["engine"]; node && !YAML::convert<EngineConfig>::decode(node, cfg.engine))
        throw std::invalid_argument("engine must be a mapping");
    if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::invalid_argument("logging must be a mapping");

    cfg.engine.validate();
    return cfg;
}

}

void EngineConfig::validate() const {
    if (chunk_size == 0) throw std::invalid_argument("engine.chunk_size must be greater than zero");
    if (max_concurrent_jobs == 0) throw std::invalid_argument("engine.max_concurrent_jobs must be greater than zero");
    if (execution_timeout.count() <= 0) throw std::invalid_argument("engine.execution_timeout_seconds must be positive");
    if (retry_delay.count() < 0) throw std::invalid_argument("engine.retry_delay_seconds must not be negative");
    if (retained_executions == 0) throw std::invalid_argument("engine.retained_executions must be greater than zero");
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return {};
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"engine", c.engine},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = {
        {"chunk_size", c.chunk_size},
        {"min_free_space", c.min_free_space},
        {"max_concurrent_jobs", c.max_concurrent_jobs},
        {"execution_timeout_seconds", c.execution_timeout.count()},
        {"retry_attempts", c.retry_attempts},
        {"retry_delay_seconds", c.retry_delay.count()},
        {"retained_executions", c.retained_executions}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"backhaul", to_std_string(spdlog::level::to_string_view(c.backhaul))},
        {"dispatch", to_std_string(spdlog::level::to_string_view(c.dispatch))},
        {"worker", to_std_string(spdlog::level::to_string_view(c.worker))},
        {"transfer", to_std_string(spdlog::level::to_string_view(c.transfer))},
        {"preflight", to_std_string(spdlog::level::to_string_view(c.preflight))},
        {"progress", to_std_string(spdlog::level::to_string_view(c.progress))},
        {"config", to_std_string(spdlog::level::to_string_view(c.config))}
    };
}

}
