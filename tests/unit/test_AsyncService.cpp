#include <gtest/gtest.h>

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fdx::concurrency;
using namespace std::chrono_literals;

namespace {

class CountingService final : public AsyncService {
public:
    CountingService(std::chrono::milliseconds interval, int failFirst = 0)
        : AsyncService("CountingService", interval), failFirst_(failFirst) {}

    ~CountingService() override { stop(); }

    std::atomic<int> ticks{0};

    bool waitForTicks(int n) const {
        for (int i = 0; i < 500 && ticks.load() < n; ++i) std::this_thread::sleep_for(5ms);
        return ticks.load() >= n;
    }

protected:
    void tick() override {
        const int n = ++ticks;
        if (n <= failFirst_) throw std::runtime_error("tick " + std::to_string(n) + " failed");
    }

private:
    int failFirst_;
};

}

TEST(AsyncServiceTest, TicksImmediatelyOnStart) {
    CountingService svc(10min);
    svc.start();
    EXPECT_TRUE(svc.waitForTicks(1));
    EXPECT_TRUE(svc.isRunning());
    svc.stop();
    EXPECT_FALSE(svc.isRunning());
    EXPECT_EQ(svc.ticks.load(), 1);
}

TEST(AsyncServiceTest, StopWakesTheIntervalWait) {
    CountingService svc(10min);
    svc.start();
    ASSERT_TRUE(svc.waitForTicks(1));

    const auto before = std::chrono::steady_clock::now();
    svc.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
    EXPECT_FALSE(svc.isRunning());
}

TEST(AsyncServiceTest, FailedTickDoesNotEndTheLoop) {
    CountingService svc(5ms, 2);
    svc.start();
    EXPECT_TRUE(svc.waitForTicks(4));
    EXPECT_TRUE(svc.isRunning());
    svc.stop();
}

TEST(AsyncServiceTest, RestartRunsAFreshTick) {
    CountingService svc(10min);
    svc.start();
    ASSERT_TRUE(svc.waitForTicks(1));

    svc.restart();
    EXPECT_TRUE(svc.waitForTicks(2));
    EXPECT_TRUE(svc.isRunning());
}

TEST(AsyncServiceTest, StopWithoutStartIsANoop) {
    CountingService svc(10ms);
    svc.stop();
    EXPECT_FALSE(svc.isRunning());
    EXPECT_EQ(svc.ticks.load(), 0);
}
