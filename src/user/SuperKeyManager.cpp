#include "user/SuperKeyManager.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <ctime>

using namespace km::user;
using namespace km::maintenance;
using namespace km::types;
using namespace km::crypto;

namespace {

std::optional<Error> checkUserId(const int32_t userId) {
    if (userId < 0) return Error::invalidArgument(fmt::format("Invalid user id {}", userId));
    return std::nullopt;
}

}

SuperKeyManager::SuperKeyManager(std::shared_ptr<db::KeyRepository> repo,
                                 std::shared_ptr<ns::Reaper> reaper,
                                 config::SuperKeysConfig kdf,
                                 const SecurityLevel superKeyLevel)
    : repo_(std::move(repo)), reaper_(std::move(reaper)), kdf_(kdf), superKeyLevel_(superKeyLevel) {}

Status SuperKeyManager::onUserAdded(const int32_t userId) {
    if (auto err = checkUserId(userId)) return *err;
    return wipeUser(userId, UserState::ActiveNoKeys, "onUserAdded");
}

Status SuperKeyManager::onUserRemoved(const int32_t userId) {
    if (auto err = checkUserId(userId)) return *err;
    return wipeUser(userId, std::nullopt, "onUserRemoved");
}

Status SuperKeyManager::wipeUser(const int32_t userId, const std::optional<UserState>& finalState, const char* op) {
    std::optional<SuperKeySet> superKeys;
    std::vector<KeyEntry> entries;
    try {
        superKeys = repo_->superKeySet(userId);
        entries = repo_->listUserEntries(userId, false);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] {}({}): lookup failed: {}", op, userId, e.what());
        return Error::systemError(fmt::format("Failed to read key set of user {}", userId));
    }

    auto report = reaper_->destroyKeys(entries);

    bool superKeysGone = true;
    if (superKeys) {
        const auto res = reaper_->destroyBlob(superKeys->security_level, superKeys->bound_key_blob);
        if (!res) {
            superKeysGone = false;
            log::Registry::users()->warn("[SuperKeyManager] {}({}): super key companion not destroyed: {}",
                                         op, userId, to_string(res.error()));
            if (!report.firstError) report.firstError = res.error();
        }
    }

    const bool complete = report.complete() && superKeysGone;

    db::ChangeSet changes;
    changes.deleteEntries = report.destroyed;
    if (superKeys && superKeysGone) changes.deleteSuperKeys.push_back(userId);
    if (complete) changes.userStates[userId] = finalState;
    else if (superKeys && superKeysGone) changes.userStates[userId] = UserState::ActiveNoKeys;

    try {
        repo_->commit(changes);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] {}({}): commit failed: {}", op, userId, e.what());
        return Error::systemError(fmt::format("Failed to record key deletion for user {}", userId));
    }

    if (!complete) {
        log::Registry::users()->error("[SuperKeyManager] {}({}): {} key(s) left behind", op, userId,
                                      report.failed.size() + (superKeysGone ? 0 : 1));
        return Error::systemError(fmt::format("Not all keys of user {} could be destroyed: {}",
                                              userId, report.firstError->message));
    }

    log::Registry::users()->info("[SuperKeyManager] {}({}): destroyed {} key(s){}, state {}", op, userId,
                                 entries.size(), superKeys ? " and super keys" : "",
                                 finalState ? to_string(*finalState) : to_string(UserState::Absent));
    return ok();
}

Status SuperKeyManager::initUserSuperKeys(const int32_t userId, const std::vector<uint8_t>& password,
                                          const bool allowExisting) {
    if (auto err = checkUserId(userId)) return *err;
    if (password.empty()) return Error::invalidArgument("Password must not be empty");

    std::optional<SuperKeySet> existing;
    try {
        existing = repo_->superKeySet(userId);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] initUserSuperKeys({}): lookup failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to read super keys of user {}", userId));
    }

    if (existing) {
        if (!allowExisting) {
            log::Registry::users()->warn("[SuperKeyManager] initUserSuperKeys({}): super keys already exist", userId);
            return Error::systemError(fmt::format("Super keys of user {} are already initialized", userId));
        }

        try {
            db::ChangeSet changes;
            changes.userStates[userId] = UserState::ActiveSuperKeysInitialized;
            repo_->commit(changes);
        } catch (const std::exception& e) {
            log::Registry::users()->error("[SuperKeyManager] initUserSuperKeys({}): commit failed: {}", userId, e.what());
            return Error::systemError(fmt::format("Failed to update state of user {}", userId));
        }
        log::Registry::users()->debug("[SuperKeyManager] initUserSuperKeys({}): keeping existing super keys", userId);
        return ok();
    }

    const auto device = reaper_->backends().get(superKeyLevel_);
    if (!device) return Error::systemError("No backend at security level " + to_string(superKeyLevel_));

    auto companion = device->createKey({.rollback_resistant = true});
    if (!companion) {
        log::Registry::users()->error("[SuperKeyManager] initUserSuperKeys({}): companion key creation failed: {}",
                                      userId, to_string(companion.error()));
        return Error::systemError(fmt::format("Failed to create hardware super key for user {}: {}",
                                              userId, companion.error().message));
    }

    SuperKeySet set;
    set.user_id = userId;
    set.security_level = superKeyLevel_;
    set.bound_key_blob = std::move(companion).value();
    set.created_at = std::time(nullptr);

    try {
        auto superKey = util::random_bytes(util::AES_KEY_SIZE);
        wrap(set, superKey, password);
        util::wipe(superKey);

        db::ChangeSet changes;
        changes.putSuperKeys = set;
        changes.userStates[userId] = UserState::ActiveSuperKeysInitialized;
        repo_->commit(changes);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] initUserSuperKeys({}): persisting failed, rolling back: {}",
                                      userId, e.what());
        if (const auto res = reaper_->destroyBlob(set.security_level, set.bound_key_blob); !res)
            log::Registry::users()->error("[SuperKeyManager] initUserSuperKeys({}): rollback of companion key failed: {}",
                                          userId, to_string(res.error()));
        return Error::systemError(fmt::format("Failed to store super keys of user {}", userId));
    }

    log::Registry::users()->info("[SuperKeyManager] Initialized super keys of user {} ({})", userId, to_string(superKeyLevel_));
    return ok();
}

Status SuperKeyManager::onUserLskfRemoved(const int32_t userId) {
    if (auto err = checkUserId(userId)) return *err;

    UserState state = UserState::Absent;
    std::vector<KeyEntry> entries;
    try {
        state = repo_->userState(userId);
        entries = repo_->listUserEntries(userId, true);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] onUserLskfRemoved({}): lookup failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to read keys of user {}", userId));
    }

    const auto report = reaper_->destroyKeys(entries);

    db::ChangeSet changes;
    changes.deleteEntries = report.destroyed;
    if (report.complete() && state == UserState::ActiveSuperKeysInitialized)
        changes.userStates[userId] = UserState::LskfRemoved;

    try {
        repo_->commit(changes);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] onUserLskfRemoved({}): commit failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to record key deletion for user {}", userId));
    }

    if (!report.complete()) {
        return Error::systemError(fmt::format("{} auth-bound key(s) of user {} could not be destroyed: {}",
                                              report.failed.size(), userId, report.firstError->message));
    }

    log::Registry::users()->info("[SuperKeyManager] LSKF removed for user {}: destroyed {} auth-bound key(s)",
                                 userId, entries.size());
    return ok();
}

Status SuperKeyManager::earlyBootEnded() {
    std::optional<Error> first;
    for (const auto& device : reaper_->backends().all()) {
        const auto res = device->earlyBootEnded();
        if (res) continue;

        log::Registry::users()->error("[SuperKeyManager] earlyBootEnded failed on {}: {}",
                                      to_string(device->securityLevel()), to_string(res.error()));
        if (first) continue;
        first = res.error().code == ErrorCode::BackendError
                    ? res.error()
                    : Error::backend(backend::error::UNKNOWN_ERROR, res.error().message);
    }

    if (first) return *first;
    return ok();
}

Status SuperKeyManager::deleteAllKeys() {
    size_t failures = 0;
    for (const auto& device : reaper_->backends().all()) {
        const auto level = device->securityLevel();

        if (const auto res = device->destroyAllKeys(); !res) {
            ++failures;
            log::Registry::users()->error("[SuperKeyManager] destroyAllKeys failed on {}: {}", to_string(level), to_string(res.error()));
            continue;
        }

        try {
            repo_->wipeSecurityLevel(level);
        } catch (const std::exception& e) {
            ++failures;
            log::Registry::users()->error("[SuperKeyManager] Wiping {} metadata failed: {}", to_string(level), e.what());
        }
    }

    if (failures) return Error::systemError(fmt::format("deleteAllKeys failed on {} security level(s)", failures));

    log::Registry::users()->warn("[SuperKeyManager] All keys on all backends deleted");
    return ok();
}

Result<UserState> SuperKeyManager::getState(const int32_t userId) {
    if (auto err = checkUserId(userId)) return *err;
    try {
        return repo_->userState(userId);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] getState({}) failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to read state of user {}", userId));
    }
}

Status SuperKeyManager::onUserPasswordChanged(const int32_t userId,
                                              const std::vector<uint8_t>& oldPassword,
                                              const std::vector<uint8_t>& newPassword) {
    if (auto err = checkUserId(userId)) return *err;
    if (newPassword.empty()) return Error::invalidArgument("New password must not be empty");

    std::optional<SuperKeySet> set;
    try {
        set = repo_->superKeySet(userId);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] onUserPasswordChanged({}): lookup failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to read super keys of user {}", userId));
    }
    if (!set) return Error::keyNotFound(fmt::format("User {} has no super keys", userId));

    auto superKey = unwrap(*set, oldPassword);
    if (!superKey) return superKey.error();

    try {
        auto key = std::move(superKey).value();
        SuperKeySet rewrapped = *set;
        wrap(rewrapped, key, newPassword);
        util::wipe(key);

        db::ChangeSet changes;
        changes.deleteSuperKeys.push_back(userId);
        changes.putSuperKeys = rewrapped;
        repo_->commit(changes);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] onUserPasswordChanged({}) failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to re-wrap super key of user {}", userId));
    }

    log::Registry::users()->info("[SuperKeyManager] Re-wrapped super key of user {} under new password", userId);
    return ok();
}

Status SuperKeyManager::unlock(const int32_t userId, const std::vector<uint8_t>& password) {
    if (auto err = checkUserId(userId)) return *err;

    std::optional<SuperKeySet> set;
    try {
        set = repo_->superKeySet(userId);
    } catch (const std::exception& e) {
        log::Registry::users()->error("[SuperKeyManager] unlock({}): lookup failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to read super keys of user {}", userId));
    }
    if (!set) return Error::keyNotFound(fmt::format("User {} has no super keys", userId));

    auto key = unwrap(*set, password);
    if (!key) return key.error();

    auto material = std::move(key).value();
    util::wipe(material);
    return ok();
}

void SuperKeyManager::wrap(SuperKeySet& set, const std::vector<uint8_t>& superKey,
                           const std::vector<uint8_t>& password) const {
    set.salt = util::random_bytes(util::KDF_SALT_SIZE);
    auto pwKey = util::derive_password_key(password, set.salt, kdf_.kdf_ops_limit, kdf_.kdf_mem_limit);
    set.encrypted_key = util::encrypt_aes256_gcm(superKey, pwKey, set.iv);
    util::wipe(pwKey);
}

Result<std::vector<uint8_t>> SuperKeyManager::unwrap(const SuperKeySet& set, const std::vector<uint8_t>& password) const {
    std::vector<uint8_t> pwKey;
    try {
        pwKey = util::derive_password_key(password, set.salt, kdf_.kdf_ops_limit, kdf_.kdf_mem_limit);
    } catch (const std::exception& e) {
        log::Registry::crypto()->error("[SuperKeyManager] Key derivation for user {} failed: {}", set.user_id, e.what());
        return Error::systemError("Password key derivation failed");
    }

    try {
        auto key = util::decrypt_aes256_gcm(set.encrypted_key, pwKey, set.iv);
        util::wipe(pwKey);
        return key;
    } catch (const std::exception&) {
        util::wipe(pwKey);
        log::Registry::auth()->warn("[SuperKeyManager] Wrong password for user {}", set.user_id);
        return Error::invalidArgument("Password does not unlock the super key");
    }
}
