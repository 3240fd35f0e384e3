#include "services/WorkerPool.hpp"
#include "services/JobScheduler.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "types/JobSpec.hpp"
#include "types/ProgressSnapshot.hpp"
#include "util/files.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unordered_map>
#include <utility>
#include <fmt/core.h>

using namespace bh::config;
using namespace bh::services;
using namespace bh::logging;
using namespace bh::types;

namespace {
constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/backhaul/config.yaml";

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-c config.yaml] job.yaml [job.yaml...]\n";
}

void logProgress(const std::string& executionId, const ProgressSnapshot& s) {
    const auto eta = s.eta_seconds ? fmt::format("{:.0f}s", *s.eta_seconds) : std::string("unknown");
    LogRegistry::progress()->info("[Progress] {} {} attempt {} {:.1f}% ({}/{}) files {}/{} {}/s eta {}",
                                  executionId, std::string(ProgressSnapshot::toString(s.phase)), s.attempt,
                                  s.percent, bh::util::formatSize(s.bytes_done), bh::util::formatSize(s.bytes_total),
                                  s.files_done, s.files_total,
                                  bh::util::formatSize(static_cast<uintmax_t>(s.rate_bytes_per_sec)), eta);
}
}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    std::vector<std::filesystem::path> jobFiles;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (++i >= argc) {
                usage(argv[0]);
                return 2;
            }
            configPath = argv[i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return EXIT_SUCCESS;
        } else jobFiles.emplace_back(arg);
    }

    if (jobFiles.empty()) {
        usage(argv[0]);
        return 2;
    }

    try {
        ConfigRegistry::init(configPath);
        LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load configuration from " << configPath << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        const auto& engine = ConfigRegistry::get().engine;

        LogRegistry::backhaul()->info("[*] Starting Backhaul: {} concurrent jobs, {} byte chunks",
                                      engine.max_concurrent_jobs, engine.chunk_size);

        const auto pool = std::make_shared<WorkerPool>(engine);
        const auto scheduler = std::make_shared<JobScheduler>(pool);
        std::vector<std::string> executions;

        pool->start();

        for (const auto& file : jobFiles) {
            const auto spec = loadJobSpec(file, engine);
            if (spec.schedule) scheduler->add(spec);
            else executions.push_back(pool->submit(spec));
        }

        if (scheduler->scheduledCount() > 0) scheduler->start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Outcomes are recorded as they are seen; the pool only retains the most recent ones
        std::unordered_map<std::string, Execution::State> finished;
        const auto collect = [&] {
            auto ids = executions;
            for (const auto& id : scheduler->firedExecutions()) ids.push_back(id);

            bool allTerminal = true;
            for (const auto& id : ids) {
                if (finished.contains(id)) continue;
                if (const auto outcome = pool->outcome(id)) {
                    finished.emplace(id, outcome->state);
                    continue;
                }
                if (!pool->execution(id)) {
                    LogRegistry::backhaul()->warn("[!] Execution {} was evicted before its outcome was seen", id);
                    finished.emplace(id, Execution::State::FAILED);
                    continue;
                }
                allTerminal = false;
                if (const auto snapshot = pool->progress(id)) logProgress(id, *snapshot);
            }
            return std::make_pair(allTerminal, ids);
        };

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (collect().first && scheduler->scheduledCount() == 0 && pool->idle()) break;
        }

        if (shouldExit) LogRegistry::backhaul()->info("[!] Signal received. Shutting down gracefully...");

        scheduler->stop();
        pool->stop();

        const auto ids = collect().second;

        bool allSucceeded = true;
        for (const auto& id : ids) {
            const auto it = finished.find(id);
            if (it == finished.end() || it->second != Execution::State::SUCCEEDED) allSucceeded = false;
        }

        LogRegistry::backhaul()->info("[✓] Backhaul finished {} execution(s), {}",
                                      ids.size(), allSucceeded ? "all succeeded" : "some did not succeed");

        return allSucceeded ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        LogRegistry::backhaul()->error("[-] Backhaul failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
