#pragma once

#include "backend/BackendSet.hpp"
#include "concurrency/LockTable.hpp"
#include "config/Config.hpp"
#include "db/KeyRepository.hpp"
#include "maintenance/Result.hpp"
#include "migrate/KeyMigrator.hpp"
#include "ns/NamespaceEraser.hpp"
#include "security/PermissionOracle.hpp"
#include "sid/SidResolver.hpp"
#include "user/SuperKeyManager.hpp"

#include <compare>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace km::maintenance {

struct LockKey {
    enum class Scope { User, Namespace };

    Scope scope{Scope::User};
    types::Domain domain{types::Domain::App};
    int64_t id{};

    auto operator<=>(const LockKey&) const = default;

    [[nodiscard]] static LockKey user(const int32_t userId) { return {Scope::User, types::Domain::App, userId}; }

    // APP namespaces are guarded by their owning user, everything else by the namespace itself.
    // App uids no user can own fall back to a namespace lock.
    [[nodiscard]] static LockKey forNamespace(const types::Domain domain, const int64_t nspace) {
        if (domain == types::Domain::App && types::is_user_app_uid(nspace)) return user(types::user_of_uid(nspace));
        return {Scope::Namespace, domain, nspace};
    }
};

/**
 * The maintenance authority.
 *
 * Every call checks the caller's permission before anything else, then takes
 * the global lock (shared, or exclusive for device-wide operations) and the
 * per-user / per-namespace locks it touches, and delegates to a component.
 * Destructive calls and every denial are written to the audit log.
 */
class Maintenance {
public:
    Maintenance(std::shared_ptr<db::KeyRepository> repo,
                std::shared_ptr<security::KeystorePermissionOracle> keystorePolicy,
                std::shared_ptr<security::PlatformPermissionOracle> platformPolicy,
                std::shared_ptr<user::SuperKeyManager> users,
                std::shared_ptr<ns::NamespaceEraser> eraser,
                std::shared_ptr<migrate::KeyMigrator> migrator,
                std::shared_ptr<sid::SidResolver> sidResolver);

    // Builds every component over repo and backends.
    static std::shared_ptr<Maintenance> create(std::shared_ptr<db::KeyRepository> repo,
                                               backend::BackendSet backends,
                                               std::shared_ptr<security::KeystorePermissionOracle> keystorePolicy,
                                               std::shared_ptr<security::PlatformPermissionOracle> platformPolicy,
                                               const config::Config& cfg);

    Status onUserAdded(const types::CallerContext& caller, int32_t userId);

    Status initUserSuperKeys(const types::CallerContext& caller, int32_t userId,
                             const std::vector<uint8_t>& password, bool allowExisting);

    Status onUserRemoved(const types::CallerContext& caller, int32_t userId);

    Status onUserLskfRemoved(const types::CallerContext& caller, int32_t userId);

    Status clearNamespace(const types::CallerContext& caller, types::Domain domain, int64_t nspace);

    Status earlyBootEnded(const types::CallerContext& caller);

    Status migrateKeyNamespace(const types::CallerContext& caller,
                               const types::KeyDescriptor& source,
                               const types::KeyDescriptor& destination);

    Status deleteAllKeys(const types::CallerContext& caller);

    Result<std::vector<int64_t>> getAppUidsAffectedBySid(const types::CallerContext& caller, int32_t userId, int64_t sid);

    Result<types::UserState> getState(const types::CallerContext& caller, int32_t userId);

    Status onUserPasswordChanged(const types::CallerContext& caller, int32_t userId,
                                 const std::vector<uint8_t>& oldPassword,
                                 const std::vector<uint8_t>& newPassword);

    [[nodiscard]] const std::shared_ptr<user::SuperKeyManager>& users() const { return users_; }

private:
    static constexpr int MIGRATE_LOCATE_ATTEMPTS = 3;

    std::shared_ptr<db::KeyRepository> repo_;
    std::shared_ptr<security::KeystorePermissionOracle> keystorePolicy_;
    std::shared_ptr<security::PlatformPermissionOracle> platformPolicy_;
    std::shared_ptr<user::SuperKeyManager> users_;
    std::shared_ptr<ns::NamespaceEraser> eraser_;
    std::shared_ptr<migrate::KeyMigrator> migrator_;
    std::shared_ptr<sid::SidResolver> sidResolver_;

    std::shared_mutex global_;
    concurrency::LockTable<LockKey> locks_;

    [[nodiscard]] Status require(const types::CallerContext& caller, security::KeystorePerm perm, const std::string& op) const;

    static void audit(const types::CallerContext& caller, const std::string& op, const std::string& target, const Status& result);
};

}
