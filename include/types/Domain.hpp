#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace km::types {

enum class Domain : int32_t { App = 0, Grant = 1, Selinux = 2, Blob = 3, KeyId = 4 };

enum class SecurityLevel : int32_t { Software = 0, TrustedEnvironment = 1, StrongBox = 2 };

std::string to_string(Domain domain);
std::optional<Domain> domain_from_string(const std::string& str);

std::string to_string(SecurityLevel level);
std::optional<SecurityLevel> security_level_from_string(const std::string& str);

// App UIDs are partitioned per user in blocks of this size.
constexpr int64_t AID_USER_OFFSET = 100000;

constexpr int32_t MAX_USER_ID = std::numeric_limits<int32_t>::max();

[[nodiscard]] constexpr int32_t user_of_uid(const int64_t uid) { return static_cast<int32_t>(uid / AID_USER_OFFSET); }
[[nodiscard]] constexpr int64_t first_uid_of_user(const int32_t userId) { return static_cast<int64_t>(userId) * AID_USER_OFFSET; }

// One past the last app uid of userId. Computed in 64 bits, so MAX_USER_ID has a bound too.
[[nodiscard]] constexpr int64_t end_uid_of_user(const int32_t userId) { return first_uid_of_user(userId) + AID_USER_OFFSET; }

// True for app uids that some non-negative user id owns.
[[nodiscard]] constexpr bool is_user_app_uid(const int64_t uid) { return uid >= 0 && uid < end_uid_of_user(MAX_USER_ID); }

/**
 * A Domain value that is known to be one of Allowed.
 *
 * Construction goes through from(), so functions taking a DomainSet never
 * need to re-check the range themselves.
 */
template <Domain... Allowed>
class DomainSet {
public:
    static constexpr std::array<Domain, sizeof...(Allowed)> allowed{Allowed...};

    [[nodiscard]] static constexpr bool contains(const Domain d) {
        return std::find(allowed.begin(), allowed.end(), d) != allowed.end();
    }

    [[nodiscard]] static constexpr std::optional<DomainSet> from(const Domain d) {
        if (!contains(d)) return std::nullopt;
        return DomainSet(d);
    }

    [[nodiscard]] constexpr Domain get() const { return domain_; }
    constexpr operator Domain() const { return domain_; }

private:
    constexpr explicit DomainSet(const Domain d) : domain_(d) {}

    Domain domain_;
};

using ClearableDomain = DomainSet<Domain::App, Domain::Selinux>;
using MigrationSourceDomain = DomainSet<Domain::App, Domain::Selinux, Domain::KeyId>;
using MigrationDestinationDomain = DomainSet<Domain::App, Domain::Selinux>;

struct KeyDescriptor {
    Domain domain{Domain::App};
    int64_t nspace{};
    std::optional<std::string> alias;
    std::optional<int64_t> keyId;

    // For Domain::KeyId descriptors the id lives in keyId, or in nspace when keyId is unset.
    [[nodiscard]] int64_t resolvedKeyId() const { return keyId.value_or(nspace); }
};

std::string to_string(const KeyDescriptor& desc);

}
