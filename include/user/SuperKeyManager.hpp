#pragma once

#include "config/Config.hpp"
#include "db/KeyRepository.hpp"
#include "ns/Reaper.hpp"

#include <memory>
#include <string>
#include <vector>

namespace km::user {

/**
 * Owns the per-user super-encryption keys and the user lifecycle state.
 *
 * Key destruction always goes backend first, then one repository commit that
 * removes only what the backend confirmed. A user's state moves only when the
 * whole operation succeeded.
 */
class SuperKeyManager {
public:
    SuperKeyManager(std::shared_ptr<db::KeyRepository> repo,
                    std::shared_ptr<ns::Reaper> reaper,
                    config::SuperKeysConfig kdf,
                    types::SecurityLevel superKeyLevel);

    maintenance::Status onUserAdded(int32_t userId);

    maintenance::Status initUserSuperKeys(int32_t userId, const std::vector<uint8_t>& password, bool allowExisting);

    maintenance::Status onUserRemoved(int32_t userId);

    maintenance::Status onUserLskfRemoved(int32_t userId);

    maintenance::Status earlyBootEnded();

    maintenance::Status deleteAllKeys();

    maintenance::Result<types::UserState> getState(int32_t userId);

    maintenance::Status onUserPasswordChanged(int32_t userId,
                                              const std::vector<uint8_t>& oldPassword,
                                              const std::vector<uint8_t>& newPassword);

    // Verifies that password opens the user's super key.
    maintenance::Status unlock(int32_t userId, const std::vector<uint8_t>& password);

private:
    std::shared_ptr<db::KeyRepository> repo_;
    std::shared_ptr<ns::Reaper> reaper_;
    config::SuperKeysConfig kdf_;
    types::SecurityLevel superKeyLevel_;

    // Destroys every APP key and the super key set of userId, then records finalState (nullopt drops the user row).
    maintenance::Status wipeUser(int32_t userId, const std::optional<types::UserState>& finalState, const char* op);

    // Seals superKey under password with a fresh salt and IV.
    void wrap(types::SuperKeySet& set, const std::vector<uint8_t>& superKey, const std::vector<uint8_t>& password) const;

    [[nodiscard]] maintenance::Result<std::vector<uint8_t>> unwrap(const types::SuperKeySet& set,
                                                                   const std::vector<uint8_t>& password) const;
};

}
