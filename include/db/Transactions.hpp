#pragma once

#include "DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace km::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg, const size_t poolSize) {
        dbPool_ = std::make_shared<DBPool>(cfg, poolSize);
    }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            if constexpr (std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
                {
                    pqxx::work txn(conn->get());
                    func(txn);
                    txn.commit();
                }
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = [&] {
                    pqxx::work txn(conn->get());
                    auto r = func(txn);
                    txn.commit();
                    return r;
                }();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] '{}' failed, rolling back: {}", ctx, e.what());
            if (conn) dbPool_->release(std::move(conn));
            throw;
        }
    }
};

}
