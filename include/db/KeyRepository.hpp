#pragma once

#include "types/KeyEntry.hpp"
#include "types/User.hpp"

#include <map>
#include <optional>
#include <vector>

namespace km::db {

// A set of mutations applied in one transaction: all of them or none.
struct ChangeSet {
    std::vector<int64_t> deleteEntries;                             // key entry ids
    std::vector<int32_t> deleteSuperKeys;                           // user ids
    std::optional<types::SuperKeySet> putSuperKeys;                 // applied after the deletes
    std::map<int32_t, std::optional<types::UserState>> userStates;  // nullopt removes the user row

    [[nodiscard]] bool empty() const {
        return deleteEntries.empty() && deleteSuperKeys.empty() && !putSuperKeys && userStates.empty();
    }
};

/**
 * Key metadata store indexed by namespace.
 *
 * Implementations throw std::exception on storage failure; a failed commit
 * leaves the store exactly as it was before the call.
 */
class KeyRepository {
public:
    virtual ~KeyRepository() = default;

    // Absent when no user row exists.
    [[nodiscard]] virtual types::UserState userState(int32_t userId) = 0;

    [[nodiscard]] virtual std::optional<types::SuperKeySet> superKeySet(int32_t userId) = 0;

    // Assigns and returns the new entry id. Throws if the alias is taken in the namespace.
    virtual int64_t insertKeyEntry(const types::KeyEntry& entry) = 0;

    // APP/SELINUX descriptors resolve by alias, KEY_ID descriptors by id.
    [[nodiscard]] virtual std::optional<types::KeyEntry> keyEntry(const types::KeyDescriptor& desc) = 0;

    [[nodiscard]] virtual std::vector<types::KeyEntry> listNamespace(types::Domain domain, int64_t nspace) = 0;

    // APP entries whose namespace is one of the user's app uids.
    [[nodiscard]] virtual std::vector<types::KeyEntry> listUserEntries(int32_t userId, bool authBoundOnly) = 0;

    // Distinct app uids of userId owning an auth-bound entry bound to sid, ascending.
    [[nodiscard]] virtual std::vector<int64_t> namespacesBoundToSid(int32_t userId, int64_t sid) = 0;

    // Moves the entry to (domain, nspace, alias). False, with nothing changed, if that alias is taken.
    virtual bool rebindKeyEntry(int64_t id, types::Domain domain, int64_t nspace, const std::string& alias) = 0;

    // Drops every entry and super key set at level; users that lose their set go back to ActiveNoKeys.
    virtual void wipeSecurityLevel(types::SecurityLevel level) = 0;

    virtual void commit(const ChangeSet& changes) = 0;
};

}
