#include "backend/TimedBackend.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <mutex>

using namespace km::backend;
using namespace km::maintenance;
using namespace km::concurrency;

TimedBackend::TimedBackend(std::shared_ptr<SecureBackend> inner,
                           std::shared_ptr<ThreadPool> pool,
                           const std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), pool_(std::move(pool)), timeout_(timeout) {
    if (!inner_ || !pool_) throw std::invalid_argument("TimedBackend requires a backend and a worker pool");
}

namespace {

// Shared between a createKey caller and the worker running it.
struct PendingCreate {
    std::mutex mutex;
    bool abandoned = false;
    bool finished = false;
};

}

// abandon() runs once on timeout. It returns true when the call finished anyway, in which
// case the answer is awaited and returned instead of the timeout.
template <typename R>
R TimedBackend::run(const char* op, std::function<R()> fn, std::function<bool()> abandon) const {
    const auto level = types::to_string(inner_->securityLevel());
    auto task = std::make_shared<PromisedTask<R>>(std::move(fn));
    auto future = task->getFuture();

    try {
        pool_->submit(task);
    } catch (const std::exception& e) {
        log::Registry::backend()->error("[TimedBackend] {} {}: could not schedule call: {}", level, op, e.what());
        return Error::systemError(fmt::format("{} backend {}: {}", level, op, e.what()));
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        if (abandon && abandon()) {
            future.wait();
        } else {
            log::Registry::backend()->error("[TimedBackend] {} {} timed out after {} ms", level, op, timeout_.count());
            return Error::systemError(fmt::format("{} backend {} timed out", level, op));
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        log::Registry::backend()->error("[TimedBackend] {} {} threw: {}", level, op, e.what());
        return Error::backend(error::UNKNOWN_ERROR, e.what());
    }
}

Result<std::vector<uint8_t>> TimedBackend::createKey(const KeyParameters& params) {
    auto inner = inner_;
    auto pending = std::make_shared<PendingCreate>();

    const auto work = [inner, params, pending] {
        auto res = inner->createKey(params);
        std::scoped_lock lock(pending->mutex);
        pending->finished = true;
        if (pending->abandoned && res) {
            const auto level = types::to_string(inner->securityLevel());
            if (const auto destroyed = inner->destroyKey(res.value()); destroyed)
                log::Registry::backend()->warn("[TimedBackend] {} destroyed a key created after its caller timed out", level);
            else
                log::Registry::backend()->error("[TimedBackend] {} could not destroy a key created after timeout: {}",
                                                level, to_string(destroyed.error()));
        }
        return res;
    };

    const auto abandon = [pending] {
        std::scoped_lock lock(pending->mutex);
        pending->abandoned = true;
        return pending->finished;
    };

    return run<Result<std::vector<uint8_t>>>("createKey", work, abandon);
}

Status TimedBackend::destroyKey(const std::vector<uint8_t>& blob) {
    auto inner = inner_;
    return run<Status>("destroyKey", [inner, blob] { return inner->destroyKey(blob); });
}

Status TimedBackend::destroyAllKeys() {
    auto inner = inner_;
    return run<Status>("destroyAllKeys", [inner] { return inner->destroyAllKeys(); });
}

Status TimedBackend::earlyBootEnded() {
    auto inner = inner_;
    return run<Status>("earlyBootEnded", [inner] { return inner->earlyBootEnded(); });
}

Status TimedBackend::checkKeyUsable(const std::vector<uint8_t>& blob) const {
    auto inner = inner_;
    return run<Status>("checkKeyUsable", [inner, blob] { return inner->checkKeyUsable(blob); });
}
