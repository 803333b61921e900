#include "security/Permission.hpp"

namespace km::security {

std::string to_string(const KeystorePerm p) {
    switch (p) {
        case KeystorePerm::ChangeUser: return "change_user";
        case KeystorePerm::ClearUid: return "clear_uid";
        case KeystorePerm::EarlyBootEnded: return "early_boot_ended";
        case KeystorePerm::DeleteAllKeys: return "delete_all_keys";
        case KeystorePerm::GetState: return "get_state";
        case KeystorePerm::ChangePassword: return "change_password";
    }
    return "unknown";
}

std::string to_string(const KeyPerm p) {
    switch (p) {
        case KeyPerm::Use: return "use";
        case KeyPerm::Grant: return "grant";
        case KeyPerm::Delete: return "delete";
        case KeyPerm::Rebind: return "rebind";
    }
    return "unknown";
}

std::string to_string(const PlatformPerm p) {
    switch (p) {
        case PlatformPerm::ManageUsers: return "manage_users";
    }
    return "unknown";
}

std::optional<KeystorePerm> keystore_perm_from_string(const std::string& str) {
    if (str == "change_user") return KeystorePerm::ChangeUser;
    if (str == "clear_uid") return KeystorePerm::ClearUid;
    if (str == "early_boot_ended") return KeystorePerm::EarlyBootEnded;
    if (str == "delete_all_keys") return KeystorePerm::DeleteAllKeys;
    if (str == "get_state") return KeystorePerm::GetState;
    if (str == "change_password") return KeystorePerm::ChangePassword;
    return std::nullopt;
}

std::optional<KeyPerm> key_perm_from_string(const std::string& str) {
    if (str == "use") return KeyPerm::Use;
    if (str == "grant") return KeyPerm::Grant;
    if (str == "delete") return KeyPerm::Delete;
    if (str == "rebind") return KeyPerm::Rebind;
    return std::nullopt;
}

}
