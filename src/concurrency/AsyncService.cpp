#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace dm::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // derived classes stop() in their own destructors; this only reaps the thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interrupt_.trigger();
        worker_.join();
    }
}

void AsyncService::start() {
    std::scoped_lock lock(lifecycleMutex_);
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interrupt_.reset();
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::docmirror()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::docmirror()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::docmirror()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!worker_.joinable()) return;

    log::Registry::docmirror()->info("[{}] Stopping service...", serviceName_);
    interrupt_.trigger();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave the interrupt set until next start() resets it
    log::Registry::docmirror()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::docmirror()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
