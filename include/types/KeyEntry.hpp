#pragma once

#include "types/Domain.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace km::types {

struct KeyAuthorizations {
    bool auth_bound{false};
    std::vector<int64_t> auth_sids;
    bool rollback_resistant{false};
    bool early_boot_only{false};

    [[nodiscard]] bool boundToSid(int64_t sid) const;
};

struct KeyEntry {
    int64_t id{};
    Domain domain{Domain::App};
    int64_t nspace{};
    std::optional<std::string> alias;
    SecurityLevel security_level{SecurityLevel::TrustedEnvironment};
    std::vector<uint8_t> blob;
    KeyAuthorizations authorizations;
    std::time_t created_at{};
};

void to_json(nlohmann::json& j, const KeyAuthorizations& a);
void from_json(const nlohmann::json& j, KeyAuthorizations& a);

// Metadata only, the blob is never serialized.
void to_json(nlohmann::json& j, const KeyEntry& e);

std::string to_string(const KeyEntry& e);

}
