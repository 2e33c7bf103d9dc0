#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace fdx::concurrency {

// Periodic worker thread. tick() runs once right after start() and then once per interval until
// stop(). stop() wakes a waiting loop at once rather than letting the interval run out. A tick
// that throws is logged and the next one runs on schedule.
class AsyncService {
public:
    AsyncService(std::string serviceName, std::chrono::milliseconds interval);

    // Subclasses stop() in their own destructor, before their members go away.
    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    void start();

    void stop();

    void restart();

    [[nodiscard]] bool isRunning() const;

    [[nodiscard]] const std::string& serviceName() const { return serviceName_; }

protected:
    virtual void tick() = 0;

private:
    std::string serviceName_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool running_ = false;
    std::thread worker_;

    void loop();
};

}
