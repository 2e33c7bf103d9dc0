#pragma once

#include "db/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>

namespace fdx::db {

class DBPool {
  public:
    DBPool(const std::string& connectionString, size_t size = 4) : size_(size) {
        if (size == 0) throw std::invalid_argument("DBPool needs at least one connection");
        for (size_t i = 0; i < size; ++i) {
            pool_.push(std::make_unique<DBConnection>(connectionString));
        }
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

    // Every pooled connection gets the prepared statements. Call once the schema exists.
    void initPreparedStatements() {
        for (size_t i = 0; i < size_; ++i) {
            auto conn = acquire();
            conn->initPrepared();
            release(std::move(conn));
        }
    }

    [[nodiscard]] size_t size() const { return size_; }

  private:
    size_t size_;
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

}
