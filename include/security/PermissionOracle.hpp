#pragma once

#include "security/Permission.hpp"
#include "types/Caller.hpp"
#include "types/Domain.hpp"

#include <cstdint>

namespace km::security {

// Keystore policy: per-action system permissions and per-namespace key permissions.
class KeystorePermissionOracle {
public:
    virtual ~KeystorePermissionOracle() = default;

    [[nodiscard]] virtual bool checkKeystorePermission(const types::CallerContext& caller, KeystorePerm perm) const = 0;

    [[nodiscard]] virtual bool checkKeyPermission(const types::CallerContext& caller,
                                                  types::Domain domain, int64_t nspace,
                                                  KeyPerm perm) const = 0;
};

// Platform policy, evaluated independently of the keystore policy.
class PlatformPermissionOracle {
public:
    virtual ~PlatformPermissionOracle() = default;

    [[nodiscard]] virtual bool checkPlatformPermission(const types::CallerContext& caller, PlatformPerm perm) const = 0;
};

}
