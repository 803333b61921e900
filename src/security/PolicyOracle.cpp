#include "security/PolicyOracle.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

using namespace km::security;
using namespace km::types;

namespace {

template <typename Perm>
uint16_t parseMask(const YAML::Node& list,
                   std::optional<Perm> (*parse)(const std::string&),
                   const std::string& where) {
    if (!list) return 0;
    if (!list.IsSequence()) throw std::runtime_error(fmt::format("Policy: '{}' permissions must be a list", where));

    uint16_t mask = 0;
    for (const auto& item : list) {
        const auto name = item.as<std::string>();
        const auto perm = parse(name);
        if (!perm) throw std::runtime_error(fmt::format("Policy: unknown permission '{}' in {}", name, where));
        mask |= static_cast<uint16_t>(*perm);
    }
    return mask;
}

}

std::shared_ptr<PolicyOracle> PolicyOracle::fromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Policy file not found: " + path.string());

    log::Registry::auth()->debug("[PolicyOracle] Loading policy from {}", path.string());
    return fromYaml(YAML::LoadFile(path.string()));
}

std::shared_ptr<PolicyOracle> PolicyOracle::fromYaml(const YAML::Node& root) {
    auto oracle = std::make_shared<PolicyOracle>(Private{});
    if (!root || root.IsNull()) return oracle;
    if (!root.IsMap()) throw std::runtime_error("Policy: top level must be a map");

    if (const auto ks = root["keystore"]) {
        for (const auto& entry : ks) {
            const auto uid = entry["uid"].as<uint32_t>();
            oracle->keystoreMasks_[uid] |= parseMask<KeystorePerm>(
                entry["permissions"], &keystore_perm_from_string, fmt::format("keystore uid {}", uid));
        }
    }

    if (const auto namespaces = root["selinux_namespaces"]) {
        for (const auto& ns : namespaces) {
            const auto nspace = ns["namespace"].as<int64_t>();
            auto& grants = oracle->selinuxGrants_[nspace];
            for (const auto& grant : ns["grants"]) {
                const auto uid = grant["uid"].as<uint32_t>();
                grants[uid] |= parseMask<KeyPerm>(
                    grant["permissions"], &key_perm_from_string,
                    fmt::format("selinux namespace {} uid {}", nspace, uid));
            }
        }
    }

    if (const auto platform = root["platform"]) {
        for (const auto& uid : platform["manage_users"])
            oracle->manageUsers_.insert(uid.as<uint32_t>());
    }

    log::Registry::auth()->info("[PolicyOracle] Loaded policy: {} keystore principals, {} selinux namespaces, {} user managers",
                                oracle->keystoreMasks_.size(), oracle->selinuxGrants_.size(), oracle->manageUsers_.size());
    return oracle;
}

bool PolicyOracle::checkKeystorePermission(const CallerContext& caller, const KeystorePerm perm) const {
    const auto it = keystoreMasks_.find(caller.uid);
    return it != keystoreMasks_.end() && hasPermission(it->second, perm);
}

bool PolicyOracle::checkKeyPermission(const CallerContext& caller, const Domain domain,
                                      const int64_t nspace, const KeyPerm perm) const {
    // App namespaces are only ever reachable by their owner, which is decided before the oracle is asked.
    if (domain != Domain::Selinux) return false;

    const auto ns = selinuxGrants_.find(nspace);
    if (ns == selinuxGrants_.end()) return false;

    const auto it = ns->second.find(caller.uid);
    return it != ns->second.end() && hasPermission(it->second, perm);
}

bool PolicyOracle::checkPlatformPermission(const CallerContext& caller, const PlatformPerm perm) const {
    switch (perm) {
        case PlatformPerm::ManageUsers: return manageUsers_.contains(caller.uid);
    }
    return false;
}
