#pragma once

#include "security/PermissionOracle.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <set>

namespace YAML { class Node; }

namespace km::security {

/**
 * Declarative allow-list loaded from YAML:
 *
 *   keystore:            [{uid, permissions: [change_user, ...]}]
 *   selinux_namespaces:  [{namespace, grants: [{uid, permissions: [use, ...]}]}]
 *   platform:
 *     manage_users:      [uid, ...]
 *
 * Anything not listed is denied. Unknown permission names are rejected at load time.
 */
class PolicyOracle final : public KeystorePermissionOracle, public PlatformPermissionOracle {
    struct Private { explicit Private() = default; };

public:
    explicit PolicyOracle(Private) {}

    static std::shared_ptr<PolicyOracle> fromFile(const std::filesystem::path& path);
    static std::shared_ptr<PolicyOracle> fromYaml(const YAML::Node& root);

    [[nodiscard]] bool checkKeystorePermission(const types::CallerContext& caller, KeystorePerm perm) const override;

    [[nodiscard]] bool checkKeyPermission(const types::CallerContext& caller,
                                          types::Domain domain, int64_t nspace,
                                          KeyPerm perm) const override;

    [[nodiscard]] bool checkPlatformPermission(const types::CallerContext& caller, PlatformPerm perm) const override;

private:
    std::map<uint32_t, uint16_t> keystoreMasks_;
    std::map<int64_t, std::map<uint32_t, uint16_t>> selinuxGrants_;
    std::set<uint32_t> manageUsers_;
};

}
