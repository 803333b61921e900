#include <gtest/gtest.h>

#include "maintenance/Result.hpp"
#include "security/Permission.hpp"
#include "types/Domain.hpp"
#include "types/KeyEntry.hpp"
#include "types/User.hpp"

using namespace km::maintenance;
using namespace km::security;
using namespace km::types;

TEST(ResultTest, ValueAndError) {
    Result<int> good = 7;
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), 7);
    EXPECT_THROW((void)good.error(), std::logic_error);

    Result<int> bad = Error::keyNotFound("gone");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.code(), ErrorCode::KeyNotFound);
    EXPECT_EQ(bad.error().message, "gone");
    EXPECT_THROW((void)bad.value(), std::logic_error);
}

TEST(ResultTest, StatusCarriesBackendCode) {
    Status s = Error::backend(-73, "early boot ended");
    ASSERT_FALSE(s);
    EXPECT_EQ(s.code(), ErrorCode::BackendError);
    EXPECT_EQ(s.error().backendCode, -73);
    EXPECT_TRUE(ok());
}

TEST(DomainTest, ClearableDomainRejectsOthers) {
    EXPECT_TRUE(ClearableDomain::from(Domain::App));
    EXPECT_TRUE(ClearableDomain::from(Domain::Selinux));
    EXPECT_FALSE(ClearableDomain::from(Domain::Grant));
    EXPECT_FALSE(ClearableDomain::from(Domain::Blob));
    EXPECT_FALSE(ClearableDomain::from(Domain::KeyId));
}

TEST(DomainTest, MigrationDomains) {
    EXPECT_TRUE(MigrationSourceDomain::from(Domain::KeyId));
    EXPECT_FALSE(MigrationDestinationDomain::from(Domain::KeyId));
    EXPECT_FALSE(MigrationSourceDomain::from(Domain::Grant));
    EXPECT_EQ(MigrationDestinationDomain::from(Domain::Selinux)->get(), Domain::Selinux);
}

TEST(DomainTest, UidPartitioning) {
    EXPECT_EQ(user_of_uid(10023), 0);
    EXPECT_EQ(user_of_uid(1010023), 10);
    EXPECT_EQ(first_uid_of_user(10), 1000000);
    EXPECT_EQ(end_uid_of_user(10), 1100000);
}

TEST(DomainTest, HighestUserHasABoundedUidRange) {
    constexpr int64_t first = int64_t{MAX_USER_ID} * AID_USER_OFFSET;
    EXPECT_EQ(first_uid_of_user(MAX_USER_ID), first);
    EXPECT_EQ(end_uid_of_user(MAX_USER_ID), first + AID_USER_OFFSET);
    EXPECT_EQ(user_of_uid(end_uid_of_user(MAX_USER_ID) - 1), MAX_USER_ID);

    EXPECT_TRUE(is_user_app_uid(first));
    EXPECT_FALSE(is_user_app_uid(end_uid_of_user(MAX_USER_ID)));
    EXPECT_FALSE(is_user_app_uid(-1));
}

TEST(DomainTest, DescriptorFormatting) {
    KeyDescriptor app{Domain::App, 10023, "wifi", std::nullopt};
    EXPECT_EQ(to_string(app), "app:10023:wifi");

    KeyDescriptor byId{Domain::KeyId, 0, std::nullopt, 42};
    EXPECT_EQ(byId.resolvedKeyId(), 42);
    EXPECT_EQ(to_string(byId), "key_id:42");

    KeyDescriptor byNs{Domain::KeyId, 17, std::nullopt, std::nullopt};
    EXPECT_EQ(byNs.resolvedKeyId(), 17);
}

TEST(DomainTest, NamesParseBack) {
    for (const auto d : {Domain::App, Domain::Grant, Domain::Selinux, Domain::Blob, Domain::KeyId})
        EXPECT_EQ(domain_from_string(to_string(d)), d);
    EXPECT_EQ(security_level_from_string("strongbox"), SecurityLevel::StrongBox);
    EXPECT_FALSE(security_level_from_string("hsm"));
    EXPECT_EQ(user_state_from_string("lskf_removed"), UserState::LskfRemoved);
}

TEST(KeyEntryTest, SidBinding) {
    KeyAuthorizations a;
    a.auth_sids = {5, 9};
    EXPECT_FALSE(a.boundToSid(5));
    a.auth_bound = true;
    EXPECT_TRUE(a.boundToSid(9));
    EXPECT_FALSE(a.boundToSid(6));
}

TEST(PermissionTest, Bitmasks) {
    const auto mask = toBitmask(std::vector{KeyPerm::Use, KeyPerm::Delete});
    EXPECT_TRUE(hasPermission(mask, KeyPerm::Use));
    EXPECT_FALSE(hasPermission(mask, KeyPerm::Grant));
    EXPECT_TRUE(hasAllPermissions(ALL_KEY_PERMS, std::vector{KeyPerm::Use, KeyPerm::Grant, KeyPerm::Delete, KeyPerm::Rebind}));
    EXPECT_FALSE(hasAllPermissions(mask, std::vector{KeyPerm::Use, KeyPerm::Rebind}));
}

TEST(PermissionTest, Names) {
    EXPECT_EQ(keystore_perm_from_string("clear_uid"), KeystorePerm::ClearUid);
    EXPECT_EQ(key_perm_from_string("rebind"), KeyPerm::Rebind);
    EXPECT_FALSE(keystore_perm_from_string("root"));
    EXPECT_EQ(to_string(KeystorePerm::DeleteAllKeys), "delete_all_keys");
}
