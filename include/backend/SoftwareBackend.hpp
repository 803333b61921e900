#pragma once

#include "backend/SecureBackend.hpp"
#include "crypto/FileKeyProvider.hpp"

#include <filesystem>
#include <mutex>
#include <set>

namespace km::backend {

/**
 * File-backed software device.
 *
 * Layout under <stateDir>/<level>/:
 *   master.key   AES-256 key sealing every blob this device hands out
 *   slots.json   live key slots; a blob is usable only while its slot is listed
 *
 * destroyKey drops the slot, destroyAllKeys drops every slot and rotates the
 * master key, so no earlier blob can be unsealed again, also after a restart.
 */
class SoftwareBackend final : public SecureBackend {
public:
    SoftwareBackend(types::SecurityLevel level, const std::filesystem::path& stateDir);

    [[nodiscard]] types::SecurityLevel securityLevel() const override { return level_; }

    maintenance::Result<std::vector<uint8_t>> createKey(const KeyParameters& params) override;
    maintenance::Status destroyKey(const std::vector<uint8_t>& blob) override;
    maintenance::Status destroyAllKeys() override;
    maintenance::Status earlyBootEnded() override;
    maintenance::Status checkKeyUsable(const std::vector<uint8_t>& blob) const override;

    [[nodiscard]] size_t liveKeyCount() const;

private:
    struct SealedKey {
        uint64_t slot{};
        bool rollback_resistant{false};
        bool early_boot_only{false};
    };

    // Caller holds mutex_.
    [[nodiscard]] maintenance::Result<SealedKey> unseal(const std::vector<uint8_t>& blob) const;
    void loadSlots();
    void persistSlots() const;

    mutable std::mutex mutex_;
    types::SecurityLevel level_;
    std::filesystem::path dir_;
    crypto::FileKeyProvider master_;
    std::set<uint64_t> slots_;
    uint64_t nextSlot_{1};
    bool earlyBootEnded_{false};
};

}
