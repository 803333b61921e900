#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace km::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["backend"]) YAML::convert<BackendConfig>::decode(node, cfg.backend);
    if (auto node = root["super_keys"]) YAML::convert<SuperKeysConfig>::decode(node, cfg.super_keys);
    if (auto node = root["policy"]) YAML::convert<PolicyConfig>::decode(node, cfg.policy);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"database", c.database},
        {"backend", c.backend},
        {"super_keys", c.super_keys},
        {"policy", c.policy}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("logging").get_to(c.logging);
    j.at("database").get_to(c.database);
    j.at("backend").get_to(c.backend);
    j.at("super_keys").get_to(c.super_keys);
    j.at("policy").get_to(c.policy);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {{"levels", c.levels}};
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", c.console_log_level},
        {"file_log_level", c.file_log_level},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = j.value("console_log_level", spdlog::level::info);
    c.file_log_level = j.value("file_log_level", spdlog::level::warn);
    j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"keymaint", c.keymaint},
        {"users", c.users},
        {"namespace", c.nspace},
        {"migrate", c.migrate},
        {"sid", c.sid},
        {"backend", c.backend},
        {"crypto", c.crypto},
        {"db", c.db},
        {"auth", c.auth}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.keymaint = j.value("keymaint", spdlog::level::info);
    c.users = j.value("users", spdlog::level::info);
    c.nspace = j.value("namespace", spdlog::level::info);
    c.migrate = j.value("migrate", spdlog::level::info);
    c.sid = j.value("sid", spdlog::level::warn);
    c.backend = j.value("backend", spdlog::level::warn);
    c.crypto = j.value("crypto", spdlog::level::warn);
    c.db = j.value("db", spdlog::level::err);
    c.auth = j.value("auth", spdlog::level::warn);
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_file", c.password_file.string()},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", 5432);
    c.name = j.value("name", "keymaint");
    c.user = j.value("user", "keymaint");
    c.password_file = j.value("password_file", "/etc/keymaint/db_password");
    c.pool_size = j.value("pool_size", 4);
}

void to_json(nlohmann::json& j, const BackendConfig& c) {
    j = {
        {"state_dir", c.state_dir.string()},
        {"security_levels", c.security_levels},
        {"super_key_security_level", c.super_key_security_level},
        {"call_timeout_ms", c.call_timeout.count()},
        {"worker_threads", c.worker_threads}
    };
}

void from_json(const nlohmann::json& j, BackendConfig& c) {
    c.state_dir = j.value("state_dir", "");
    c.security_levels = j.value("security_levels", std::vector<std::string>{"tee", "strongbox"});
    c.super_key_security_level = j.value("super_key_security_level", "tee");
    c.call_timeout = std::chrono::milliseconds(j.value("call_timeout_ms", 5000L));
    c.worker_threads = j.value("worker_threads", 4u);
}

void to_json(nlohmann::json& j, const SuperKeysConfig& c) {
    j = {
        {"kdf_ops_limit", c.kdf_ops_limit},
        {"kdf_mem_limit", c.kdf_mem_limit}
    };
}

void from_json(const nlohmann::json& j, SuperKeysConfig& c) {
    c.kdf_ops_limit = j.value("kdf_ops_limit", 2ull);
    c.kdf_mem_limit = j.value("kdf_mem_limit", std::size_t{64ull * 1024 * 1024});
}

void to_json(nlohmann::json& j, const PolicyConfig& c) {
    j = {{"path", c.path.string()}};
}

void from_json(const nlohmann::json& j, PolicyConfig& c) {
    c.path = j.value("path", "/etc/keymaint/policy.yaml");
}

} // namespace km::config
