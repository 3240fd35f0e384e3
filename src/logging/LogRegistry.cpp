#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <filesystem>

namespace bh::logging {

void LogRegistry::init() {
    init(config::ConfigRegistry::get().logging);
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;
    main_log_path_  = log_dir_ / "backhaul.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("backhaul",  sub_levels.backhaul);
    makeLogger("dispatch",  sub_levels.dispatch);
    makeLogger("worker",    sub_levels.worker);
    makeLogger("transfer",  sub_levels.transfer);
    makeLogger("preflight", sub_levels.preflight);
    makeLogger("progress",  sub_levels.progress);
    makeLogger("config",    sub_levels.config);

    // audit: file-only sink (append), one JSON outcome per line
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        std::vector<spdlog::sink_ptr> sinks = { audit_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    backhaul()->info("[LogRegistry] Initialized, writing to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> LogRegistry::jobLog(const std::string& jobId) {
    return jobLog(jobId, util::getDate());
}

std::shared_ptr<spdlog::logger> LogRegistry::jobLog(const std::string& jobId, const std::string& date) {
    if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot open job log: " + jobId);

    const auto file = util::sanitizeFilename(jobId) + "-" + date + ".csv";
    const auto name = "job:" + file;

    std::scoped_lock lock(jobLogMutex_);
    if (auto existing = spdlog::get(name)) return existing;

    // Day rolled over: release the previous file instead of keeping one open per day
    if (const auto it = jobLogNames_.find(jobId); it != jobLogNames_.end()) spdlog::drop(it->second);

    const auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>((log_dir_ / file).string(), /*truncate=*/false);
    sink->set_pattern(CSV_FORMAT);

    const auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    spdlog::register_logger(logger);
    jobLogNames_[jobId] = name;
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
