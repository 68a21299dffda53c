#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace sw::concurrency;
using namespace sw::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous loop exited on its own

    interruptFlag_.store(false, std::memory_order_release);
    {
        std::scoped_lock lock(sleepMutex_);
        wakePending_ = false;
    }
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::warden()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::warden()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::warden()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    LogRegistry::warden()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    LogRegistry::warden()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::lazySleep(const std::chrono::milliseconds duration) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return shouldStop(); });
}

void AsyncService::idleUntilWoken() {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait(lock, [this] { return shouldStop() || wakePending_; });
    wakePending_ = false;
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(sleepMutex_);
        wakePending_ = true;
    }
    sleepCv_.notify_all();
}
