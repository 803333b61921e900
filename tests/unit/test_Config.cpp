#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "runtime/paths.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace km::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = km::paths::getStatePath() / "config-test.yaml";
        fs::create_directories(file.parent_path());
    }

    void TearDown() override { fs::remove(file); }

    void write(const std::string& yaml) const {
        std::ofstream out(file);
        out << yaml;
    }
};

TEST_F(ConfigTest, RegistryFallsBackToDefaults) {
    // gtest_main initialised the registry from a path that does not exist
    const auto& cfg = ConfigRegistry::get();
    EXPECT_EQ(cfg.backend.super_key_security_level, "tee");
    EXPECT_EQ(cfg.database.port, 5432);
}

TEST_F(ConfigTest, LoadsSectionsAndKeepsDefaultsForMissingKeys) {
    write(R"(
database:
  host: db.internal
  pool_size: 2
backend:
  security_levels: [tee]
  call_timeout_ms: 250
  worker_threads: 1
super_keys:
  kdf_ops_limit: 3
logging:
  levels:
    console_log_level: debug
    subsystem_levels:
      auth: info
policy:
  path: /tmp/policy.yaml
)");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.pool_size, 2);
    EXPECT_EQ(cfg.database.name, "keymaint");
    EXPECT_EQ(cfg.backend.security_levels, std::vector<std::string>{"tee"});
    EXPECT_EQ(cfg.backend.call_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.backend.worker_threads, 1u);
    EXPECT_EQ(cfg.backend.super_key_security_level, "tee");
    EXPECT_EQ(cfg.super_keys.kdf_ops_limit, 3u);
    EXPECT_EQ(cfg.super_keys.kdf_mem_limit, 64ull * 1024 * 1024);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.auth, spdlog::level::info);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
    EXPECT_EQ(cfg.policy.path, "/tmp/policy.yaml");
}

TEST_F(ConfigTest, JsonViewMatchesLoadedValues) {
    write("backend:\n  worker_threads: 7\n");
    const auto cfg = loadConfig(file);

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["backend"]["worker_threads"], 7);

    Config back = j.get<Config>();
    EXPECT_EQ(back.backend.worker_threads, 7u);
    EXPECT_EQ(back.database.host, cfg.database.host);
}
