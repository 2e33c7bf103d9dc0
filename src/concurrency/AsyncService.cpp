#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

#include <utility>

using namespace fdx::concurrency;

AsyncService::AsyncService(std::string serviceName, const std::chrono::milliseconds interval)
    : serviceName_(std::move(serviceName)), interval_(interval) {}

AsyncService::~AsyncService() { stop(); }

void AsyncService::start() {
    if (worker_.joinable()) {
        if (isRunning()) return;
        worker_.join(); // stopped from inside tick(), never joined
    }

    {
        std::lock_guard lock(mutex_);
        stopping_ = false;
        running_ = true;
    }
    worker_ = std::thread(&AsyncService::loop, this);

    log::Registry::filedex()->info("[{}] Service started, interval {}ms", serviceName_, interval_.count());
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();

    // a tick stopping its own service cannot join itself; start() joins it later
    if (std::this_thread::get_id() == worker_.get_id()) return;

    log::Registry::filedex()->info("[{}] Stopping service...", serviceName_);
    worker_.join();
    log::Registry::filedex()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::filedex()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

bool AsyncService::isRunning() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void AsyncService::loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        try {
            tick();
        } catch (const std::exception& e) {
            log::Registry::filedex()->error("[{}] Tick failed: {}", serviceName_, e.what());
        }
        lock.lock();

        wake_.wait_for(lock, interval_, [this] { return stopping_; });
    }
    running_ = false;
}
