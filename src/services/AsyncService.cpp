#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace bh::services;
using namespace bh::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::backhaul()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    LogRegistry::backhaul()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::backhaul()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    LogRegistry::backhaul()->info("[{}] Service stopped.", serviceName_);
}
