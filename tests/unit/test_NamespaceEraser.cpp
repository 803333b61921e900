#include <gtest/gtest.h>

#include "fakes/Harness.hpp"

using namespace km;
using namespace km::maintenance;
using namespace km::types;
using km::test::Harness;

class NamespaceEraserTest : public ::testing::Test {
protected:
    Harness h;

    static ClearableDomain selinux() { return *ClearableDomain::from(Domain::Selinux); }
    static ClearableDomain app() { return *ClearableDomain::from(Domain::App); }
};

TEST_F(NamespaceEraserTest, ClearsOnlyTheTargetNamespace) {
    const auto a = h.addKey(Domain::Selinux, 102, "a");
    const auto b = h.addKey(Domain::Selinux, 102, "b", SecurityLevel::StrongBox);
    const auto neighbour = h.addKey(Domain::Selinux, 103, "a");
    const auto appKey = h.addKey(Domain::App, 102, "a");

    ASSERT_TRUE(h.eraser->clearNamespace(selinux(), 102));

    EXPECT_FALSE(h.repo->entryById(a.id));
    EXPECT_FALSE(h.repo->entryById(b.id));
    EXPECT_FALSE(h.tee->isLive(a.blob));
    EXPECT_FALSE(h.strongbox->isLive(b.blob));

    EXPECT_TRUE(h.repo->entryById(neighbour.id));
    EXPECT_TRUE(h.repo->entryById(appKey.id));
    EXPECT_TRUE(h.tee->isLive(appKey.blob));
}

TEST_F(NamespaceEraserTest, EmptyNamespaceSucceeds) {
    EXPECT_TRUE(h.eraser->clearNamespace(app(), 10023));
    EXPECT_EQ(h.repo->commitCount.load(), 0);
}

TEST_F(NamespaceEraserTest, PartialFailureKeepsExactlyTheSurvivors) {
    const auto a = h.addKey(Domain::App, 10023, "a");
    const auto b = h.addKey(Domain::App, 10023, "b");
    const auto c = h.addKey(Domain::App, 10023, "c");
    h.tee->failDestroyOf(b.blob);

    const auto res = h.eraser->clearNamespace(app(), 10023);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.code(), ErrorCode::SystemError);

    EXPECT_FALSE(h.repo->entryById(a.id));
    EXPECT_TRUE(h.repo->entryById(b.id));
    EXPECT_FALSE(h.repo->entryById(c.id));
    EXPECT_TRUE(h.tee->isLive(b.blob));

    h.tee->heal();
    ASSERT_TRUE(h.eraser->clearNamespace(app(), 10023));
    EXPECT_EQ(h.repo->entryCount(), 0u);
}

TEST_F(NamespaceEraserTest, RetryAfterLostCommitConverges) {
    const auto a = h.addKey(Domain::Selinux, 7, "a");
    h.repo->failCommits = 1;

    EXPECT_EQ(h.eraser->clearNamespace(selinux(), 7).code(), ErrorCode::SystemError);
    EXPECT_FALSE(h.tee->isLive(a.blob));
    EXPECT_TRUE(h.repo->entryById(a.id));

    ASSERT_TRUE(h.eraser->clearNamespace(selinux(), 7));
    EXPECT_FALSE(h.repo->entryById(a.id));
}

TEST_F(NamespaceEraserTest, ListingFailureIsSystemError) {
    h.addKey(Domain::Selinux, 7, "a");
    h.repo->failReads = 1;
    EXPECT_EQ(h.eraser->clearNamespace(selinux(), 7).code(), ErrorCode::SystemError);
    EXPECT_EQ(h.repo->entryCount(), 1u);
}

TEST_F(NamespaceEraserTest, MissingDeviceLeavesEntry) {
    auto lonely = std::make_shared<test::MemoryKeyRepository>();
    backend::BackendSet onlyTee;
    onlyTee.add(h.tee);
    ns::NamespaceEraser eraser(lonely, std::make_shared<ns::Reaper>(std::move(onlyTee)));

    KeyEntry e;
    e.domain = Domain::Selinux;
    e.nspace = 5;
    e.alias = "sb";
    e.security_level = SecurityLevel::StrongBox;
    e.blob = {1, 2, 3};
    const auto id = lonely->insertKeyEntry(e);

    EXPECT_EQ(eraser.clearNamespace(selinux(), 5).code(), ErrorCode::SystemError);
    EXPECT_TRUE(lonely->entryById(id));
}
