#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace km::security {

enum class KeystorePerm : uint16_t {
    ChangeUser      = 1ULL << 0, // user added/removed, super key init, lskf removed
    ClearUid        = 1ULL << 1, // clear an app or selinux namespace
    EarlyBootEnded  = 1ULL << 2,
    DeleteAllKeys   = 1ULL << 3, // global wipe of every backend
    GetState        = 1ULL << 4,
    ChangePassword  = 1ULL << 5,
};

enum class KeyPerm : uint16_t {
    Use     = 1ULL << 0,
    Grant   = 1ULL << 1,
    Delete  = 1ULL << 2,
    Rebind  = 1ULL << 3,
};

enum class PlatformPerm : uint16_t {
    ManageUsers = 1ULL << 0,
};

constexpr uint16_t ALL_KEY_PERMS = 0x000F;

std::string to_string(KeystorePerm p);
std::string to_string(KeyPerm p);
std::string to_string(PlatformPerm p);

std::optional<KeystorePerm> keystore_perm_from_string(const std::string& str);
std::optional<KeyPerm> key_perm_from_string(const std::string& str);

template <typename T>
uint16_t toBitmask(const std::vector<T>& perms) {
    uint16_t mask = 0;
    for (auto p : perms) mask |= static_cast<uint16_t>(p);
    return mask;
}

template <typename T>
bool hasPermission(const uint16_t mask, T perm) { return (mask & static_cast<uint16_t>(perm)) != 0; }

template <typename T>
bool hasAllPermissions(const uint16_t mask, const std::vector<T>& perms) {
    const auto want = toBitmask(perms);
    return (mask & want) == want;
}

}
