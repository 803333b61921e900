#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace km::concurrency {

// Keyed mutexes created on demand and dropped once no holder or waiter references them.
// Multi-key acquisition locks in ascending key order, so two callers never deadlock.
template <typename Key>
class LockTable {
    struct Slot {
        std::mutex mutex;
        size_t refs = 0;
    };

public:
    class Guard {
    public:
        Guard() = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        Guard(Guard&& other) noexcept : table_(other.table_), held_(std::move(other.held_)) {
            other.table_ = nullptr;
            other.held_.clear();
        }

        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                table_ = other.table_;
                held_ = std::move(other.held_);
                other.table_ = nullptr;
                other.held_.clear();
            }
            return *this;
        }

        ~Guard() { release(); }

        void release() {
            if (!table_) return;
            for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
                it->second->mutex.unlock();
                table_->unref(it->first);
            }
            held_.clear();
            table_ = nullptr;
        }

        [[nodiscard]] size_t size() const { return held_.size(); }

    private:
        friend class LockTable;
        explicit Guard(LockTable* table) : table_(table) {}

        LockTable* table_ = nullptr;
        std::vector<std::pair<Key, std::shared_ptr<Slot>>> held_;
    };

    [[nodiscard]] Guard acquire(std::vector<Key> keys) {
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

        Guard guard(this);
        for (const auto& key : keys) {
            auto slot = ref(key);
            slot->mutex.lock();
            guard.held_.emplace_back(key, std::move(slot));
        }
        return guard;
    }

    [[nodiscard]] Guard acquire(const Key& key) { return acquire(std::vector<Key>{key}); }

    // Number of live slots, for diagnostics.
    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::shared_ptr<Slot> ref(const Key& key) {
        std::scoped_lock lock(mutex_);
        auto& slot = slots_[key];
        if (!slot) slot = std::make_shared<Slot>();
        ++slot->refs;
        return slot;
    }

    void unref(const Key& key) {
        std::scoped_lock lock(mutex_);
        const auto it = slots_.find(key);
        if (it == slots_.end()) return;
        if (--it->second->refs == 0) slots_.erase(it);
    }

    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<Slot>> slots_;
};

}
