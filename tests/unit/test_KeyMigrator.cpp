#include <gtest/gtest.h>

#include "fakes/Harness.hpp"

using namespace km;
using namespace km::maintenance;
using namespace km::security;
using namespace km::types;
using km::test::Harness;

class KeyMigratorTest : public ::testing::Test {
protected:
    Harness h;

    static constexpr int64_t APP_UID = 10023;
    CallerContext app{static_cast<uint32_t>(APP_UID), 100, "u:r:untrusted_app:s0"};

    static KeyDescriptor appKey(const int64_t uid, const std::string& alias) {
        return {Domain::App, uid, alias, std::nullopt};
    }

    static KeyDescriptor selinuxKey(const int64_t ns, const std::string& alias) {
        return {Domain::Selinux, ns, alias, std::nullopt};
    }
};

TEST_F(KeyMigratorTest, OwnerMovesKeyWithinOwnNamespace) {
    const auto key = h.addKey(Domain::App, APP_UID, "old");

    ASSERT_TRUE(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "old"), appKey(APP_UID, "new")));

    const auto moved = h.repo->entryById(key.id);
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved->alias, "new");
    EXPECT_EQ(moved->blob, key.blob);
    EXPECT_TRUE(h.tee->isLive(key.blob));
    EXPECT_FALSE(h.repo->keyEntry(appKey(APP_UID, "old")));
}

TEST_F(KeyMigratorTest, MissingSourceIsKeyNotFound) {
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "nothing"), appKey(APP_UID, "x")).code(),
              ErrorCode::KeyNotFound);

    KeyDescriptor byId{Domain::KeyId, 0, std::nullopt, 999};
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, byId, appKey(APP_UID, "x")).code(), ErrorCode::KeyNotFound);
}

TEST_F(KeyMigratorTest, OccupiedDestinationChangesNothing) {
    const auto src = h.addKey(Domain::App, APP_UID, "src");
    const auto dst = h.addKey(Domain::App, APP_UID, "dst");

    for (int attempt = 0; attempt < 2; ++attempt) {
        const auto res = h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "src"), appKey(APP_UID, "dst"));
        ASSERT_FALSE(res);
        EXPECT_EQ(res.code(), ErrorCode::InvalidArgument);
    }

    EXPECT_EQ(h.repo->entryById(src.id)->alias, "src");
    EXPECT_EQ(h.repo->entryById(dst.id)->alias, "dst");
    EXPECT_EQ(h.repo->entryCount(), 2u);
}

TEST_F(KeyMigratorTest, DomainAndAliasValidation) {
    h.addKey(Domain::App, APP_UID, "src");

    KeyDescriptor grant{Domain::Grant, 1, "g", std::nullopt};
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, grant, appKey(APP_UID, "x")).code(), ErrorCode::InvalidArgument);

    KeyDescriptor toKeyId{Domain::KeyId, 0, "x", 1};
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "src"), toKeyId).code(), ErrorCode::InvalidArgument);

    KeyDescriptor noAlias{Domain::App, APP_UID, std::nullopt, std::nullopt};
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "src"), noAlias).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, noAlias, appKey(APP_UID, "x")).code(), ErrorCode::InvalidArgument);
}

TEST_F(KeyMigratorTest, ForeignAppNamespaceIsDenied) {
    const auto key = h.addKey(Domain::App, 10099, "theirs");

    const auto res = h.migrator->migrateKeyNamespace(app, appKey(10099, "theirs"), appKey(APP_UID, "mine"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.code(), ErrorCode::PermissionDenied);
    EXPECT_EQ(h.repo->entryById(key.id)->nspace, 10099);
}

TEST_F(KeyMigratorTest, SelinuxDestinationNeedsRebind) {
    const auto key = h.addKey(Domain::App, APP_UID, "k");

    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "k"), selinuxKey(102, "k")).code(),
              ErrorCode::PermissionDenied);

    h.oracle->grantKey(app.uid, Domain::Selinux, 102, static_cast<uint16_t>(KeyPerm::Rebind));
    ASSERT_TRUE(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "k"), selinuxKey(102, "k")));

    const auto moved = h.repo->entryById(key.id);
    EXPECT_EQ(moved->domain, Domain::Selinux);
    EXPECT_EQ(moved->nspace, 102);
}

TEST_F(KeyMigratorTest, SelinuxSourceNeedsUseGrantAndDelete) {
    const auto key = h.addKey(Domain::Selinux, 102, "shared");
    CallerContext daemon{1010, 5, "u:r:vold:s0"};
    h.oracle->grantKey(daemon.uid, Domain::Selinux, 103, ALL_KEY_PERMS);

    h.oracle->grantKey(daemon.uid, Domain::Selinux, 102,
                       toBitmask(std::vector{KeyPerm::Use, KeyPerm::Grant}));
    EXPECT_EQ(h.migrator->migrateKeyNamespace(daemon, selinuxKey(102, "shared"), selinuxKey(103, "shared")).code(),
              ErrorCode::PermissionDenied);

    h.oracle->grantKey(daemon.uid, Domain::Selinux, 102, static_cast<uint16_t>(KeyPerm::Delete));
    ASSERT_TRUE(h.migrator->migrateKeyNamespace(daemon, selinuxKey(102, "shared"), selinuxKey(103, "shared")));
    EXPECT_EQ(h.repo->entryById(key.id)->nspace, 103);
}

TEST_F(KeyMigratorTest, KeyIdSourceUsesOwningNamespaceForPermissions) {
    const auto key = h.addKey(Domain::App, APP_UID, "by-id");

    KeyDescriptor byId{Domain::KeyId, 0, std::nullopt, key.id};
    ASSERT_TRUE(h.migrator->migrateKeyNamespace(app, byId, appKey(APP_UID, "renamed")));
    EXPECT_EQ(h.repo->entryById(key.id)->alias, "renamed");

    CallerContext stranger{10077, 1, ""};
    EXPECT_EQ(h.migrator->migrateKeyNamespace(stranger, byId, appKey(10077, "stolen")).code(),
              ErrorCode::PermissionDenied);
}

TEST_F(KeyMigratorTest, LookupFailureIsSystemError) {
    h.addKey(Domain::App, APP_UID, "k");
    h.repo->failReads = 1;
    EXPECT_EQ(h.migrator->migrateKeyNamespace(app, appKey(APP_UID, "k"), appKey(APP_UID, "j")).code(),
              ErrorCode::SystemError);
}
