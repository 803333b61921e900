#pragma once

#include "backend/SecureBackend.hpp"

#include <map>
#include <memory>
#include <vector>

namespace km::config { struct BackendConfig; }
namespace km::concurrency { class ThreadPool; }

namespace km::backend {

// The devices present on this system, at most one per security level.
class BackendSet {
public:
    BackendSet() = default;

    // Software devices for every configured level, each wrapped in a TimedBackend on pool.
    static BackendSet fromConfig(const config::BackendConfig& cfg,
                                 const std::shared_ptr<concurrency::ThreadPool>& pool);

    void add(std::shared_ptr<SecureBackend> backend);

    // nullptr when no device exists at that level.
    [[nodiscard]] std::shared_ptr<SecureBackend> get(types::SecurityLevel level) const;

    [[nodiscard]] std::vector<std::shared_ptr<SecureBackend>> all() const;

    [[nodiscard]] bool empty() const { return backends_.empty(); }

private:
    std::map<types::SecurityLevel, std::shared_ptr<SecureBackend>> backends_;
};

}
