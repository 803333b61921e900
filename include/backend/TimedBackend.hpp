#pragma once

#include "backend/SecureBackend.hpp"
#include "concurrency/ThreadPool.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace km::backend {

// Runs every call of the wrapped device on a worker pool and gives up after a fixed timeout.
// A timed-out call keeps running on its worker; its late answer is discarded, and a key
// created after its caller gave up is destroyed on the device.
class TimedBackend final : public SecureBackend {
public:
    TimedBackend(std::shared_ptr<SecureBackend> inner,
                 std::shared_ptr<concurrency::ThreadPool> pool,
                 std::chrono::milliseconds timeout);

    [[nodiscard]] types::SecurityLevel securityLevel() const override { return inner_->securityLevel(); }

    maintenance::Result<std::vector<uint8_t>> createKey(const KeyParameters& params) override;
    maintenance::Status destroyKey(const std::vector<uint8_t>& blob) override;
    maintenance::Status destroyAllKeys() override;
    maintenance::Status earlyBootEnded() override;
    maintenance::Status checkKeyUsable(const std::vector<uint8_t>& blob) const override;

private:
    template <typename R>
    R run(const char* op, std::function<R()> fn, std::function<bool()> abandon = {}) const;

    std::shared_ptr<SecureBackend> inner_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::chrono::milliseconds timeout_;
};

}
