#include "maintenance/Maintenance.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <stdexcept>

using namespace km::maintenance;
using namespace km::security;
using namespace km::types;

Maintenance::Maintenance(std::shared_ptr<db::KeyRepository> repo,
                         std::shared_ptr<KeystorePermissionOracle> keystorePolicy,
                         std::shared_ptr<PlatformPermissionOracle> platformPolicy,
                         std::shared_ptr<user::SuperKeyManager> users,
                         std::shared_ptr<ns::NamespaceEraser> eraser,
                         std::shared_ptr<migrate::KeyMigrator> migrator,
                         std::shared_ptr<sid::SidResolver> sidResolver)
    : repo_(std::move(repo)),
      keystorePolicy_(std::move(keystorePolicy)),
      platformPolicy_(std::move(platformPolicy)),
      users_(std::move(users)),
      eraser_(std::move(eraser)),
      migrator_(std::move(migrator)),
      sidResolver_(std::move(sidResolver)) {}

std::shared_ptr<Maintenance> Maintenance::create(std::shared_ptr<db::KeyRepository> repo,
                                                 backend::BackendSet backends,
                                                 std::shared_ptr<KeystorePermissionOracle> keystorePolicy,
                                                 std::shared_ptr<PlatformPermissionOracle> platformPolicy,
                                                 const config::Config& cfg) {
    const auto superKeyLevel = security_level_from_string(cfg.backend.super_key_security_level);
    if (!superKeyLevel)
        throw std::runtime_error("Unknown super key security level: " + cfg.backend.super_key_security_level);
    if (!backends.get(*superKeyLevel))
        throw std::runtime_error("No backend configured for super key security level " + to_string(*superKeyLevel));

    auto reaper = std::make_shared<ns::Reaper>(std::move(backends));

    return std::make_shared<Maintenance>(
        repo, keystorePolicy, std::move(platformPolicy),
        std::make_shared<user::SuperKeyManager>(repo, reaper, cfg.super_keys, *superKeyLevel),
        std::make_shared<ns::NamespaceEraser>(repo, reaper),
        std::make_shared<migrate::KeyMigrator>(repo, keystorePolicy),
        std::make_shared<sid::SidResolver>(repo));
}

Status Maintenance::require(const CallerContext& caller, const KeystorePerm perm, const std::string& op) const {
    if (keystorePolicy_->checkKeystorePermission(caller, perm)) return ok();

    log::Registry::auth()->warn("[Maintenance] {} denied: uid {} (pid {}) lacks {}", op, caller.uid, caller.pid, to_string(perm));
    return Error::permissionDenied(fmt::format("Caller uid {} lacks the {} permission", caller.uid, to_string(perm)));
}

void Maintenance::audit(const CallerContext& caller, const std::string& op, const std::string& target, const Status& result) {
    const auto outcome = result ? std::string("ok") : to_string(result.error());
    log::Registry::audit()->info("uid={} pid={} ctx='{}' op={} target={} result={}",
                                 caller.uid, caller.pid, caller.selinux_context, op, target, outcome);
}

Status Maintenance::onUserAdded(const CallerContext& caller, const int32_t userId) {
    const auto target = fmt::format("user:{}", userId);
    if (auto denied = require(caller, KeystorePerm::ChangeUser, "onUserAdded"); !denied) {
        audit(caller, "onUserAdded", target, denied);
        return denied;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    auto res = users_->onUserAdded(userId);
    audit(caller, "onUserAdded", target, res);
    return res;
}

Status Maintenance::initUserSuperKeys(const CallerContext& caller, const int32_t userId,
                                      const std::vector<uint8_t>& password, const bool allowExisting) {
    const auto target = fmt::format("user:{}", userId);
    if (auto denied = require(caller, KeystorePerm::ChangeUser, "initUserSuperKeys"); !denied) {
        audit(caller, "initUserSuperKeys", target, denied);
        return denied;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    auto res = users_->initUserSuperKeys(userId, password, allowExisting);
    audit(caller, "initUserSuperKeys", target, res);
    return res;
}

Status Maintenance::onUserRemoved(const CallerContext& caller, const int32_t userId) {
    const auto target = fmt::format("user:{}", userId);
    if (auto denied = require(caller, KeystorePerm::ChangeUser, "onUserRemoved"); !denied) {
        audit(caller, "onUserRemoved", target, denied);
        return denied;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    auto res = users_->onUserRemoved(userId);
    audit(caller, "onUserRemoved", target, res);
    return res;
}

Status Maintenance::onUserLskfRemoved(const CallerContext& caller, const int32_t userId) {
    const auto target = fmt::format("user:{}", userId);
    if (auto denied = require(caller, KeystorePerm::ChangeUser, "onUserLskfRemoved"); !denied) {
        audit(caller, "onUserLskfRemoved", target, denied);
        return denied;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    auto res = users_->onUserLskfRemoved(userId);
    audit(caller, "onUserLskfRemoved", target, res);
    return res;
}

Status Maintenance::clearNamespace(const CallerContext& caller, const Domain domain, const int64_t nspace) {
    const auto target = fmt::format("{}:{}", to_string(domain), nspace);
    if (auto denied = require(caller, KeystorePerm::ClearUid, "clearNamespace"); !denied) {
        audit(caller, "clearNamespace", target, denied);
        return denied;
    }

    const auto clearable = ClearableDomain::from(domain);
    if (!clearable) {
        Status res = Error::invalidArgument("Only app and selinux namespaces can be cleared, got " + to_string(domain));
        audit(caller, "clearNamespace", target, res);
        return res;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::forNamespace(domain, nspace));
    auto res = eraser_->clearNamespace(*clearable, nspace);
    audit(caller, "clearNamespace", target, res);
    return res;
}

Status Maintenance::earlyBootEnded(const CallerContext& caller) {
    if (auto denied = require(caller, KeystorePerm::EarlyBootEnded, "earlyBootEnded"); !denied) {
        audit(caller, "earlyBootEnded", "*", denied);
        return denied;
    }

    std::unique_lock global(global_);
    auto res = users_->earlyBootEnded();
    audit(caller, "earlyBootEnded", "*", res);
    return res;
}

Status Maintenance::migrateKeyNamespace(const CallerContext& caller,
                                        const KeyDescriptor& source,
                                        const KeyDescriptor& destination) {
    const auto target = fmt::format("{} -> {}", to_string(source), to_string(destination));

    std::shared_lock global(global_);
    const auto destinationKey = LockKey::forNamespace(destination.domain, destination.nspace);

    if (source.domain != Domain::KeyId) {
        const auto guard = locks_.acquire(std::vector<LockKey>{destinationKey, LockKey::forNamespace(source.domain, source.nspace)});
        auto res = migrator_->migrateKeyNamespace(caller, source, destination);
        audit(caller, "migrateKeyNamespace", target, res);
        return res;
    }

    // The owning namespace of a key id is only known after a lookup, and the key may be
    // moved by another call before that namespace is locked.
    const auto locate = [&]() -> std::optional<LockKey> {
        if (const auto entry = repo_->keyEntry(source)) return LockKey::forNamespace(entry->domain, entry->nspace);
        return std::nullopt;
    };

    try {
        for (int attempt = 0; attempt < MIGRATE_LOCATE_ATTEMPTS; ++attempt) {
            const auto seen = locate();

            std::vector<LockKey> keys{destinationKey};
            if (seen) keys.push_back(*seen);
            const auto guard = locks_.acquire(std::move(keys));

            if (locate() != seen) {
                log::Registry::migrate()->debug("[Maintenance] {} moved while waiting for its lock, retrying", to_string(source));
                continue;
            }

            auto res = migrator_->migrateKeyNamespace(caller, source, destination);
            audit(caller, "migrateKeyNamespace", target, res);
            return res;
        }
    } catch (const std::exception& e) {
        log::Registry::migrate()->error("[Maintenance] Resolving {} failed: {}", to_string(source), e.what());
        Status res = Error::systemError("Failed to resolve migration source");
        audit(caller, "migrateKeyNamespace", target, res);
        return res;
    }

    log::Registry::migrate()->error("[Maintenance] {} kept moving, giving up after {} attempts",
                                    to_string(source), MIGRATE_LOCATE_ATTEMPTS);
    Status res = Error::systemError("Migration source was moved concurrently");
    audit(caller, "migrateKeyNamespace", target, res);
    return res;
}

Status Maintenance::deleteAllKeys(const CallerContext& caller) {
    if (auto denied = require(caller, KeystorePerm::DeleteAllKeys, "deleteAllKeys"); !denied) {
        audit(caller, "deleteAllKeys", "*", denied);
        return denied;
    }

    std::unique_lock global(global_);
    auto res = users_->deleteAllKeys();
    audit(caller, "deleteAllKeys", "*", res);
    return res;
}

Result<std::vector<int64_t>> Maintenance::getAppUidsAffectedBySid(const CallerContext& caller,
                                                                  const int32_t userId, const int64_t sid) {
    if (!platformPolicy_->checkPlatformPermission(caller, PlatformPerm::ManageUsers)) {
        log::Registry::auth()->warn("[Maintenance] getAppUidsAffectedBySid denied: uid {} lacks manage_users", caller.uid);
        Status denied = Error::permissionDenied(fmt::format("Caller uid {} lacks the manage_users permission", caller.uid));
        audit(caller, "getAppUidsAffectedBySid", fmt::format("user:{}", userId), denied);
        return denied.error();
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    return sidResolver_->getAppUidsAffectedBySid(userId, sid);
}

Result<UserState> Maintenance::getState(const CallerContext& caller, const int32_t userId) {
    if (auto denied = require(caller, KeystorePerm::GetState, "getState"); !denied) {
        audit(caller, "getState", fmt::format("user:{}", userId), denied);
        return denied.error();
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    return users_->getState(userId);
}

Status Maintenance::onUserPasswordChanged(const CallerContext& caller, const int32_t userId,
                                          const std::vector<uint8_t>& oldPassword,
                                          const std::vector<uint8_t>& newPassword) {
    const auto target = fmt::format("user:{}", userId);
    if (auto denied = require(caller, KeystorePerm::ChangePassword, "onUserPasswordChanged"); !denied) {
        audit(caller, "onUserPasswordChanged", target, denied);
        return denied;
    }

    std::shared_lock global(global_);
    const auto guard = locks_.acquire(LockKey::user(userId));
    auto res = users_->onUserPasswordChanged(userId, oldPassword, newPassword);
    audit(caller, "onUserPasswordChanged", target, res);
    return res;
}
