#pragma once

#include "db/KeyRepository.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace km::test {

// Transactional in-memory KeyRepository. Commits apply to a copy that replaces the live state only on success.
class MemoryKeyRepository final : public db::KeyRepository {
public:
    // The next n commits throw without changing anything.
    std::atomic<int> failCommits{0};
    std::atomic<int> failReads{0};
    std::atomic<int> commitCount{0};
    // Runs before every keyEntry lookup, outside the repository lock.
    std::function<void()> onKeyEntryLookup;

    types::UserState userState(const int32_t userId) override {
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        const auto it = state_.users.find(userId);
        return it == state_.users.end() ? types::UserState::Absent : it->second;
    }

    std::optional<types::SuperKeySet> superKeySet(const int32_t userId) override {
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        const auto it = state_.superKeys.find(userId);
        if (it == state_.superKeys.end()) return std::nullopt;
        return it->second;
    }

    int64_t insertKeyEntry(const types::KeyEntry& entry) override {
        std::scoped_lock lock(mutex_);
        if (entry.alias && aliasTaken(state_, entry.domain, entry.nspace, *entry.alias, -1))
            throw std::runtime_error("duplicate alias " + *entry.alias);
        auto copy = entry;
        copy.id = nextId_++;
        state_.entries[copy.id] = copy;
        return copy.id;
    }

    std::optional<types::KeyEntry> keyEntry(const types::KeyDescriptor& desc) override {
        if (onKeyEntryLookup) onKeyEntryLookup();
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        if (desc.domain == types::Domain::KeyId) {
            const auto it = state_.entries.find(desc.resolvedKeyId());
            if (it == state_.entries.end()) return std::nullopt;
            return it->second;
        }
        if (!desc.alias) return std::nullopt;
        for (const auto& [_, e] : state_.entries)
            if (e.domain == desc.domain && e.nspace == desc.nspace && e.alias == desc.alias) return e;
        return std::nullopt;
    }

    std::vector<types::KeyEntry> listNamespace(const types::Domain domain, const int64_t nspace) override {
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        std::vector<types::KeyEntry> out;
        for (const auto& [_, e] : state_.entries)
            if (e.domain == domain && e.nspace == nspace) out.push_back(e);
        return out;
    }

    std::vector<types::KeyEntry> listUserEntries(const int32_t userId, const bool authBoundOnly) override {
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        std::vector<types::KeyEntry> out;
        for (const auto& [_, e] : state_.entries) {
            if (e.domain != types::Domain::App || e.nspace < types::first_uid_of_user(userId)
                || e.nspace >= types::end_uid_of_user(userId))
                continue;
            if (authBoundOnly && !e.authorizations.auth_bound) continue;
            out.push_back(e);
        }
        return out;
    }

    std::vector<int64_t> namespacesBoundToSid(const int32_t userId, const int64_t sid) override {
        std::scoped_lock lock(mutex_);
        maybeFailRead();
        std::vector<int64_t> out;
        for (const auto& [_, e] : state_.entries)
            if (e.domain == types::Domain::App && e.nspace >= types::first_uid_of_user(userId)
                && e.nspace < types::end_uid_of_user(userId)
                && e.authorizations.boundToSid(sid))
                out.push_back(e.nspace);
        std::ranges::sort(out);
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    bool rebindKeyEntry(const int64_t id, const types::Domain domain, const int64_t nspace, const std::string& alias) override {
        std::scoped_lock lock(mutex_);
        maybeFailCommit();
        if (aliasTaken(state_, domain, nspace, alias, id)) return false;
        auto& e = state_.entries.at(id);
        e.domain = domain;
        e.nspace = nspace;
        e.alias = alias;
        ++commitCount;
        return true;
    }

    void wipeSecurityLevel(const types::SecurityLevel level) override {
        std::scoped_lock lock(mutex_);
        maybeFailCommit();
        auto next = state_;
        std::erase_if(next.entries, [&](const auto& kv) { return kv.second.security_level == level; });
        for (auto it = next.superKeys.begin(); it != next.superKeys.end();) {
            if (it->second.security_level == level) {
                next.users[it->first] = types::UserState::ActiveNoKeys;
                it = next.superKeys.erase(it);
            } else ++it;
        }
        state_ = std::move(next);
        ++commitCount;
    }

    void commit(const db::ChangeSet& changes) override {
        std::scoped_lock lock(mutex_);
        maybeFailCommit();

        auto next = state_;
        for (const auto id : changes.deleteEntries) next.entries.erase(id);
        for (const auto userId : changes.deleteSuperKeys) next.superKeys.erase(userId);
        if (changes.putSuperKeys) {
            const auto& s = *changes.putSuperKeys;
            if (next.superKeys.contains(s.user_id)) throw std::runtime_error("duplicate super key set");
            next.superKeys[s.user_id] = s;
        }
        for (const auto& [userId, st] : changes.userStates) {
            if (st) next.users[userId] = *st;
            else next.users.erase(userId);
        }

        state_ = std::move(next);
        ++commitCount;
    }

    // Test inspection helpers

    [[nodiscard]] size_t entryCount() const {
        std::scoped_lock lock(mutex_);
        return state_.entries.size();
    }

    [[nodiscard]] std::vector<int64_t> entryIds() const {
        std::scoped_lock lock(mutex_);
        std::vector<int64_t> ids;
        for (const auto& [id, _] : state_.entries) ids.push_back(id);
        return ids;
    }

    [[nodiscard]] std::optional<types::KeyEntry> entryById(const int64_t id) const {
        std::scoped_lock lock(mutex_);
        const auto it = state_.entries.find(id);
        if (it == state_.entries.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] size_t superKeyCount() const {
        std::scoped_lock lock(mutex_);
        return state_.superKeys.size();
    }

    [[nodiscard]] bool hasUserRow(const int32_t userId) const {
        std::scoped_lock lock(mutex_);
        return state_.users.contains(userId);
    }

private:
    struct State {
        std::map<int32_t, types::UserState> users;
        std::map<int32_t, types::SuperKeySet> superKeys;
        std::map<int64_t, types::KeyEntry> entries;
    };

    static bool aliasTaken(const State& s, const types::Domain domain, const int64_t nspace,
                           const std::string& alias, const int64_t exceptId) {
        return std::ranges::any_of(s.entries, [&](const auto& kv) {
            const auto& e = kv.second;
            return e.id != exceptId && e.domain == domain && e.nspace == nspace && e.alias == alias;
        });
    }

    void maybeFailCommit() {
        if (failCommits.load() > 0) {
            --failCommits;
            throw std::runtime_error("injected commit failure");
        }
    }

    void maybeFailRead() {
        if (failReads.load() > 0) {
            --failReads;
            throw std::runtime_error("injected read failure");
        }
    }

    mutable std::mutex mutex_;
    State state_;
    int64_t nextId_{1};
};

}
