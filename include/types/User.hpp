#pragma once

#include "types/Domain.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace km::types {

enum class UserState { Absent, ActiveNoKeys, ActiveSuperKeysInitialized, LskfRemoved };

std::string to_string(UserState state);
std::optional<UserState> user_state_from_string(const std::string& str);

struct SuperKeySet {
    int32_t user_id{};

    // Software super key, AES-256-GCM sealed under an Argon2id password key.
    std::vector<uint8_t> encrypted_key, iv, salt;

    // Hardware companion key created through the secure backend.
    SecurityLevel security_level{SecurityLevel::TrustedEnvironment};
    std::vector<uint8_t> bound_key_blob;

    std::time_t created_at{};
};

}
