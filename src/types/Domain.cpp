#include "types/Domain.hpp"

#include <fmt/format.h>

namespace km::types {

std::string to_string(const Domain domain) {
    switch (domain) {
        case Domain::App: return "app";
        case Domain::Grant: return "grant";
        case Domain::Selinux: return "selinux";
        case Domain::Blob: return "blob";
        case Domain::KeyId: return "key_id";
    }
    return "unknown";
}

std::optional<Domain> domain_from_string(const std::string& str) {
    if (str == "app") return Domain::App;
    if (str == "grant") return Domain::Grant;
    if (str == "selinux") return Domain::Selinux;
    if (str == "blob") return Domain::Blob;
    if (str == "key_id") return Domain::KeyId;
    return std::nullopt;
}

std::string to_string(const SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Software: return "software";
        case SecurityLevel::TrustedEnvironment: return "tee";
        case SecurityLevel::StrongBox: return "strongbox";
    }
    return "unknown";
}

std::optional<SecurityLevel> security_level_from_string(const std::string& str) {
    if (str == "software") return SecurityLevel::Software;
    if (str == "tee") return SecurityLevel::TrustedEnvironment;
    if (str == "strongbox") return SecurityLevel::StrongBox;
    return std::nullopt;
}

std::string to_string(const KeyDescriptor& desc) {
    if (desc.domain == Domain::KeyId) return fmt::format("key_id:{}", desc.resolvedKeyId());
    return fmt::format("{}:{}:{}", to_string(desc.domain), desc.nspace, desc.alias.value_or("<none>"));
}

}
