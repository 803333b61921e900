#pragma once

#include "maintenance/Result.hpp"
#include "types/Domain.hpp"

#include <cstdint>
#include <vector>

namespace km::backend {

// Device error codes, reported unmodified inside maintenance::Error::backendCode.
namespace error {
constexpr int32_t INVALID_KEY_BLOB = -33;
constexpr int32_t ROLLBACK_RESISTANCE_UNAVAILABLE = -67;
constexpr int32_t EARLY_BOOT_ENDED = -73;
constexpr int32_t HARDWARE_NOT_YET_AVAILABLE = -85;
constexpr int32_t UNKNOWN_ERROR = -1000;
}

struct KeyParameters {
    bool rollback_resistant{false};
    bool early_boot_only{false};
    bool auth_bound{false};
    std::vector<int64_t> auth_sids;
};

// One secure key-material device at a single security level.
class SecureBackend {
public:
    virtual ~SecureBackend() = default;

    [[nodiscard]] virtual types::SecurityLevel securityLevel() const = 0;

    // Returns the opaque key blob.
    virtual maintenance::Result<std::vector<uint8_t>> createKey(const KeyParameters& params) = 0;

    virtual maintenance::Status destroyKey(const std::vector<uint8_t>& blob) = 0;

    // Erases every key the device ever produced, rollback-resistant ones included.
    virtual maintenance::Status destroyAllKeys() = 0;

    virtual maintenance::Status earlyBootEnded() = 0;

    // Ok if the blob could still be used for an operation.
    virtual maintenance::Status checkKeyUsable(const std::vector<uint8_t>& blob) const = 0;
};

// A destroy answered with INVALID_KEY_BLOB means the key is already gone.
[[nodiscard]] inline bool isAlreadyDestroyed(const maintenance::Error& err) {
    return err.code == maintenance::ErrorCode::BackendError && err.backendCode == error::INVALID_KEY_BLOB;
}

}
