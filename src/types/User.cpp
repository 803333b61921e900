#include "types/User.hpp"

namespace km::types {

std::string to_string(const UserState state) {
    switch (state) {
        case UserState::Absent: return "absent";
        case UserState::ActiveNoKeys: return "active_no_keys";
        case UserState::ActiveSuperKeysInitialized: return "active_super_keys_initialized";
        case UserState::LskfRemoved: return "lskf_removed";
    }
    return "unknown";
}

std::optional<UserState> user_state_from_string(const std::string& str) {
    if (str == "absent") return UserState::Absent;
    if (str == "active_no_keys") return UserState::ActiveNoKeys;
    if (str == "active_super_keys_initialized") return UserState::ActiveSuperKeysInitialized;
    if (str == "lskf_removed") return UserState::LskfRemoved;
    return std::nullopt;
}

}
