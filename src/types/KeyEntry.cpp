#include "types/KeyEntry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace km::types {

bool KeyAuthorizations::boundToSid(const int64_t sid) const {
    return auth_bound && std::ranges::find(auth_sids, sid) != auth_sids.end();
}

void to_json(nlohmann::json& j, const KeyAuthorizations& a) {
    j = nlohmann::json{
        {"auth_bound", a.auth_bound},
        {"auth_sids", a.auth_sids},
        {"rollback_resistant", a.rollback_resistant},
        {"early_boot_only", a.early_boot_only}
    };
}

void from_json(const nlohmann::json& j, KeyAuthorizations& a) {
    a.auth_bound = j.value("auth_bound", false);
    a.auth_sids = j.value("auth_sids", std::vector<int64_t>{});
    a.rollback_resistant = j.value("rollback_resistant", false);
    a.early_boot_only = j.value("early_boot_only", false);
}

void to_json(nlohmann::json& j, const KeyEntry& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"domain", to_string(e.domain)},
        {"namespace", e.nspace},
        {"security_level", to_string(e.security_level)},
        {"authorizations", e.authorizations},
        {"created_at", e.created_at}
    };
    if (e.alias) j["alias"] = *e.alias;
}

std::string to_string(const KeyEntry& e) {
    return fmt::format("KeyEntry(id={}, {}:{}:{}, level={}, auth_bound={})",
                       e.id, to_string(e.domain), e.nspace, e.alias.value_or("<none>"),
                       to_string(e.security_level), e.authorizations.auth_bound);
}

}
