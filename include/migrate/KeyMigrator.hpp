#pragma once

#include "db/KeyRepository.hpp"
#include "maintenance/Result.hpp"
#include "security/PermissionOracle.hpp"
#include "types/Caller.hpp"

#include <memory>

namespace km::migrate {

// Re-homes one key to a new (domain, namespace, alias) without touching its key material.
class KeyMigrator {
public:
    KeyMigrator(std::shared_ptr<db::KeyRepository> repo,
                std::shared_ptr<security::KeystorePermissionOracle> oracle);

    maintenance::Status migrateKeyNamespace(const types::CallerContext& caller,
                                            const types::KeyDescriptor& source,
                                            const types::KeyDescriptor& destination);

    // The owning app uid holds every key permission on its own APP namespace, the keystore policy decides the rest.
    [[nodiscard]] bool hasKeyPermission(const types::CallerContext& caller, types::Domain domain,
                                        int64_t nspace, security::KeyPerm perm) const;

private:
    std::shared_ptr<db::KeyRepository> repo_;
    std::shared_ptr<security::KeystorePermissionOracle> oracle_;
};

}
