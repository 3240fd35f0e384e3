#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace bh::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> backhaul()  { return get("backhaul"); }
    static std::shared_ptr<spdlog::logger> dispatch()  { return get("dispatch"); }
    static std::shared_ptr<spdlog::logger> worker()    { return get("worker"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> preflight() { return get("preflight"); }
    static std::shared_ptr<spdlog::logger> progress()  { return get("progress"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }
    static std::shared_ptr<spdlog::logger> audit()     { return get("audit"); }

    // Per-job CSV log: <log_dir>/<job id>-<YYYYMMDD>.csv. Opening a job's log
    // for a new date closes the one for the previous date.
    static std::shared_ptr<spdlog::logger> jobLog(const std::string& jobId);
    static std::shared_ptr<spdlog::logger> jobLog(const std::string& jobId, const std::string& date);

    [[nodiscard]] static bool isInitialized();

    [[nodiscard]] static const std::filesystem::path& logDir() { return log_dir_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* CSV_FORMAT = "%Y-%m-%d %H:%M:%S,%l,%v";

    static inline bool initialized_ = false;
    static inline std::mutex jobLogMutex_;
    static inline std::unordered_map<std::string, std::string> jobLogNames_; // job id -> registered logger

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path audit_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
