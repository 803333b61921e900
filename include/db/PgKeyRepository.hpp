#pragma once

#include "db/KeyRepository.hpp"

namespace km::db {

// KeyRepository over PostgreSQL. Requires Transactions::init() first.
class PgKeyRepository final : public KeyRepository {
public:
    [[nodiscard]] types::UserState userState(int32_t userId) override;
    [[nodiscard]] std::optional<types::SuperKeySet> superKeySet(int32_t userId) override;
    int64_t insertKeyEntry(const types::KeyEntry& entry) override;
    [[nodiscard]] std::optional<types::KeyEntry> keyEntry(const types::KeyDescriptor& desc) override;
    [[nodiscard]] std::vector<types::KeyEntry> listNamespace(types::Domain domain, int64_t nspace) override;
    [[nodiscard]] std::vector<types::KeyEntry> listUserEntries(int32_t userId, bool authBoundOnly) override;
    [[nodiscard]] std::vector<int64_t> namespacesBoundToSid(int32_t userId, int64_t sid) override;
    bool rebindKeyEntry(int64_t id, types::Domain domain, int64_t nspace, const std::string& alias) override;
    void wipeSecurityLevel(types::SecurityLevel level) override;
    void commit(const ChangeSet& changes) override;
};

}
