#include <gtest/gtest.h>

#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "security/ProcessCaller.hpp"

#include "fakes/Harness.hpp"

#include <sstream>
#include <unistd.h>

using namespace km;
using namespace km::shell;
using namespace km::types;
using km::test::Harness;

TEST(ParserTest, FlagsAndPositionals) {
    const auto call = parseArgs({"--config", "/etc/k.yaml", "init-super-keys", "10", "--allow-existing", "--config=/tmp/c.yaml"},
                                {"allow-existing"});
    EXPECT_EQ(call.name, "init-super-keys");
    EXPECT_EQ(call.positionals, std::vector<std::string>{"10"});
    EXPECT_EQ(call.flag("config"), "/tmp/c.yaml");
    EXPECT_TRUE(call.hasFlag("allow-existing"));
    EXPECT_FALSE(call.flag("allow-existing").has_value());
}

TEST(ParserTest, DoubleDashEndsFlags) {
    const auto call = parseArgs({"migrate", "--", "--weird", "x"});
    EXPECT_EQ(call.name, "migrate");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"--weird", "x"}));
}

TEST(ParserTest, LastFlagWins) {
    const auto call = parseArgs({"--config", "a.yaml", "--config", "b.yaml", "state"});
    EXPECT_EQ(call.flag("config"), "b.yaml");
    EXPECT_EQ(call.options.size(), 1u);
}

TEST(ParserTest, IdentityFlagsAreDetected) {
    EXPECT_EQ(identityFlag(parseArgs({"--uid", "1000", "delete-all-keys"})), "uid");
    EXPECT_EQ(identityFlag(parseArgs({"state", "0", "--pid=1"})), "pid");
    EXPECT_EQ(identityFlag(parseArgs({"--context", "u:r:system_server:s0", "state", "0"})), "context");
    EXPECT_FALSE(identityFlag(parseArgs({"--config", "/etc/keymaint/config.yaml", "state", "0"})));
}

TEST(ProcessCallerTest, IsTheRunningProcess) {
    const auto caller = security::processCaller();
    EXPECT_EQ(caller.uid, static_cast<uint32_t>(::getuid()));
    EXPECT_EQ(caller.pid, static_cast<int32_t>(::getpid()));
    EXPECT_EQ(caller.selinux_context.find('\n'), std::string::npos);
}

TEST(ParserTest, Integers) {
    EXPECT_EQ(parseInt("42"), 42);
    EXPECT_EQ(parseInt("-7"), -7);
    EXPECT_FALSE(parseInt(""));
    EXPECT_FALSE(parseInt("12abc"));
}

TEST(ParserTest, Descriptors) {
    const auto app = parseDescriptor("app:10023:wifi:key");
    ASSERT_TRUE(app);
    EXPECT_EQ(app->domain, Domain::App);
    EXPECT_EQ(app->nspace, 10023);
    EXPECT_EQ(app->alias, "wifi:key");

    const auto byId = parseDescriptor("key_id:42");
    ASSERT_TRUE(byId);
    EXPECT_EQ(byId->domain, Domain::KeyId);
    EXPECT_EQ(byId->resolvedKeyId(), 42);

    EXPECT_FALSE(parseDescriptor("app"));
    EXPECT_FALSE(parseDescriptor("vault:1:x"));
    EXPECT_FALSE(parseDescriptor("selinux:abc:x"));
    EXPECT_FALSE(parseDescriptor("key_id:1:alias"));
}

class RouterTest : public ::testing::Test {
protected:
    Harness h;
    std::istringstream in;
    Router router;

    void SetUp() override { registerMaintenanceCommands(router, h.authority, h.system, in); }

    CommandResult run(const std::vector<std::string>& args, const std::string& stdinText = "") {
        in.clear();
        in.str(stdinText);
        return router.execute(parseArgs(args, {"allow-existing"}));
    }
};

TEST_F(RouterTest, UnknownCommandIsUsageError) {
    const auto r = run({"format-everything"});
    EXPECT_EQ(r.exit_code, EXIT_USAGE);
    EXPECT_NE(r.stderr_text.find("Unknown command"), std::string::npos);
}

TEST_F(RouterTest, BadArgumentsAreUsageErrors) {
    EXPECT_EQ(run({"user-added"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"user-added", "ten"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"clear-namespace", "vault", "1"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"migrate", "app:1:a", "bogus"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"init-super-keys", "10"}).exit_code, EXIT_USAGE);
}

TEST_F(RouterTest, UserLifecycleThroughCommands) {
    EXPECT_EQ(run({"user_added", "10"}).exit_code, EXIT_OK);
    EXPECT_EQ(run({"state", "10"}).stdout_text, "active_no_keys\n");

    EXPECT_EQ(run({"init-super-keys", "10"}, "secret\n").exit_code, EXIT_OK);
    EXPECT_EQ(run({"State", "10"}).stdout_text, "active_super_keys_initialized\n");
    EXPECT_TRUE(h.users->unlock(10, Harness::bytes("secret")));

    const auto again = run({"init-super-keys", "10"}, "secret\n");
    EXPECT_EQ(again.exit_code, EXIT_MAINTENANCE_ERROR);
    EXPECT_EQ(again.stderr_text.rfind("SystemError: ", 0), 0u);
    EXPECT_EQ(run({"init-super-keys", "10", "--allow-existing"}, "x\n").exit_code, EXIT_OK);

    EXPECT_EQ(run({"password-changed", "10"}, "secret\nnewer\n").exit_code, EXIT_OK);
    EXPECT_TRUE(h.users->unlock(10, Harness::bytes("newer")));

    EXPECT_EQ(run({"user-removed", "10"}).exit_code, EXIT_OK);
    EXPECT_EQ(run({"state", "10"}).stdout_text, "absent\n");
}

TEST_F(RouterTest, ErrorsCarryTheErrorKind) {
    const auto r = run({"password-changed", "3"}, "a\nb\n");
    EXPECT_EQ(r.exit_code, EXIT_MAINTENANCE_ERROR);
    EXPECT_EQ(r.stderr_text.rfind("KeyNotFound: ", 0), 0u);
}

TEST_F(RouterTest, AffectedUidsPrintsOnePerLine) {
    h.addKey(Domain::App, 20, "a", SecurityLevel::TrustedEnvironment, true, {9});
    h.addKey(Domain::App, 10, "b", SecurityLevel::TrustedEnvironment, true, {9});

    const auto r = run({"affected-uids", "0", "9"});
    EXPECT_EQ(r.exit_code, EXIT_OK);
    EXPECT_EQ(r.stdout_text, "10\n20\n");
    ASSERT_TRUE(r.has_data);
    EXPECT_EQ(r.data.size(), 2u);
}

TEST_F(RouterTest, ClearAndMigrate) {
    const auto key = h.addKey(Domain::Selinux, 102, "k");
    h.addKey(Domain::App, 10023, "a");

    EXPECT_EQ(run({"migrate", "key_id:" + std::to_string(key.id), "selinux:102:renamed"}).exit_code,
              EXIT_MAINTENANCE_ERROR);

    EXPECT_EQ(run({"clear-namespace", "selinux", "102"}).exit_code, EXIT_OK);
    EXPECT_FALSE(h.repo->entryById(key.id));
    EXPECT_EQ(h.repo->entryCount(), 1u);

    EXPECT_EQ(run({"early-boot-ended"}).exit_code, EXIT_OK);
    EXPECT_EQ(run({"delete-all-keys"}).exit_code, EXIT_OK);
    EXPECT_EQ(h.repo->entryCount(), 0u);
}

TEST_F(RouterTest, UsageListsEveryCommand) {
    const auto text = router.usage();
    for (const auto* name : {"user-added", "user-removed", "lskf-removed", "init-super-keys", "password-changed",
                             "clear-namespace", "early-boot-ended", "delete-all-keys", "migrate", "affected-uids", "state"})
        EXPECT_NE(text.find(name), std::string::npos) << name;
}
