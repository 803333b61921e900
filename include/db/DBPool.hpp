#pragma once

#include "DBConnection.hpp"
#include "Schema.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace km::db {

class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg, const size_t size = 4) {
        for (size_t i = 0; i < size; ++i) {
            auto conn = std::make_unique<DBConnection>(cfg);
            if (i == 0) Schema::init(conn->get()); // statements can only be prepared once the tables exist
            conn->initPrepared();
            pool_.push(std::move(conn));
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

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace km::db
