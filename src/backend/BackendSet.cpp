#include "backend/BackendSet.hpp"
#include "backend/SoftwareBackend.hpp"
#include "backend/TimedBackend.hpp"
#include "config/Config.hpp"
#include "runtime/paths.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace km::backend;
using namespace km::types;

BackendSet BackendSet::fromConfig(const config::BackendConfig& cfg,
                                  const std::shared_ptr<concurrency::ThreadPool>& pool) {
    const auto stateDir = cfg.state_dir.empty() ? paths::getStatePath() / "backend" : cfg.state_dir;

    BackendSet set;
    for (const auto& name : cfg.security_levels) {
        const auto level = security_level_from_string(name);
        if (!level) throw std::runtime_error("Unknown security level in backend config: " + name);

        auto device = std::make_shared<SoftwareBackend>(*level, stateDir);
        set.add(std::make_shared<TimedBackend>(std::move(device), pool, cfg.call_timeout));
    }

    log::Registry::backend()->info("[BackendSet] {} device(s) under {}", set.backends_.size(), stateDir.string());
    return set;
}

void BackendSet::add(std::shared_ptr<SecureBackend> backend) {
    if (!backend) throw std::invalid_argument("BackendSet::add: null backend");
    const auto level = backend->securityLevel();
    if (!backends_.emplace(level, std::move(backend)).second)
        throw std::invalid_argument("Duplicate backend for security level " + to_string(level));
}

std::shared_ptr<SecureBackend> BackendSet::get(const SecurityLevel level) const {
    const auto it = backends_.find(level);
    return it == backends_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<SecureBackend>> BackendSet::all() const {
    std::vector<std::shared_ptr<SecureBackend>> out;
    out.reserve(backends_.size());
    for (const auto& [_, b] : backends_) out.push_back(b);
    return out;
}
