#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace km::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum keymaint   = spdlog::level::info;   // Startup, wiring, CLI dispatch
    spdlog::level::level_enum users      = spdlog::level::info;   // User lifecycle transitions
    spdlog::level::level_enum nspace     = spdlog::level::info;   // Namespace erasure
    spdlog::level::level_enum migrate    = spdlog::level::info;   // Key re-homing
    spdlog::level::level_enum sid        = spdlog::level::warn;   // Read-only lookups
    spdlog::level::level_enum backend    = spdlog::level::warn;   // Device failures and timeouts
    spdlog::level::level_enum crypto     = spdlog::level::warn;   // Wrap/unwrap failures
    spdlog::level::level_enum db         = spdlog::level::err;    // Failed transactions
    spdlog::level::level_enum auth       = spdlog::level::warn;   // Permission denials
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "keymaint";
    std::string user = "keymaint";
    std::filesystem::path password_file = "/etc/keymaint/db_password";
    int pool_size = 4;
};

struct BackendConfig {
    std::filesystem::path state_dir{}; // empty -> paths::getStatePath() / "backend"
    std::vector<std::string> security_levels = {"tee", "strongbox"};
    std::string super_key_security_level = "tee";
    std::chrono::milliseconds call_timeout = std::chrono::milliseconds(5000);
    unsigned int worker_threads = 4;
};

struct SuperKeysConfig {
    unsigned long long kdf_ops_limit = 2;                 // crypto_pwhash_OPSLIMIT_INTERACTIVE
    std::size_t kdf_mem_limit = 64ull * 1024 * 1024;      // crypto_pwhash_MEMLIMIT_INTERACTIVE
};

struct PolicyConfig {
    std::filesystem::path path = "/etc/keymaint/policy.yaml";
};

struct Config {
    LoggingConfig logging;
    DatabaseConfig database;
    BackendConfig backend;
    SuperKeysConfig super_keys;
    PolicyConfig policy;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const BackendConfig& c);
void from_json(const nlohmann::json& j, BackendConfig& c);
void to_json(nlohmann::json& j, const SuperKeysConfig& c);
void from_json(const nlohmann::json& j, SuperKeysConfig& c);
void to_json(nlohmann::json& j, const PolicyConfig& c);
void from_json(const nlohmann::json& j, PolicyConfig& c);

} // namespace km::config
