#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace km::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["keymaint"]  = to_std_string(spdlog::level::to_string_view(rhs.keymaint));
        node["users"]     = to_std_string(spdlog::level::to_string_view(rhs.users));
        node["namespace"] = to_std_string(spdlog::level::to_string_view(rhs.nspace));
        node["migrate"]   = to_std_string(spdlog::level::to_string_view(rhs.migrate));
        node["sid"]       = to_std_string(spdlog::level::to_string_view(rhs.sid));
        node["backend"]   = to_std_string(spdlog::level::to_string_view(rhs.backend));
        node["crypto"]    = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["auth"]      = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.keymaint = spdlog::level::from_str(node["keymaint"].as<std::string>("info"));
        rhs.users = spdlog::level::from_str(node["users"].as<std::string>("info"));
        rhs.nspace = spdlog::level::from_str(node["namespace"].as<std::string>("info"));
        rhs.migrate = spdlog::level::from_str(node["migrate"].as<std::string>("info"));
        rhs.sid = spdlog::level::from_str(node["sid"].as<std::string>("warn"));
        rhs.backend = spdlog::level::from_str(node["backend"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_file"] = rhs.password_file.string();
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("keymaint");
        rhs.user = node["user"].as<std::string>("keymaint");
        rhs.password_file = node["password_file"].as<std::string>("/etc/keymaint/db_password");
        rhs.pool_size = node["pool_size"].as<int>(4);
        return true;
    }
};

template<>
struct convert<BackendConfig> {
    static Node encode(const BackendConfig& rhs) {
        Node node;
        node["state_dir"] = rhs.state_dir.string();
        node["security_levels"] = rhs.security_levels;
        node["super_key_security_level"] = rhs.super_key_security_level;
        node["call_timeout_ms"] = rhs.call_timeout.count();
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, BackendConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.state_dir = node["state_dir"].as<std::string>("");
        if (node["security_levels"]) rhs.security_levels = node["security_levels"].as<std::vector<std::string>>();
        rhs.super_key_security_level = node["super_key_security_level"].as<std::string>("tee");
        rhs.call_timeout = std::chrono::milliseconds(node["call_timeout_ms"].as<long>(5000));
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<SuperKeysConfig> {
    static Node encode(const SuperKeysConfig& rhs) {
        Node node;
        node["kdf_ops_limit"] = rhs.kdf_ops_limit;
        node["kdf_mem_limit"] = rhs.kdf_mem_limit;
        return node;
    }

    static bool decode(const Node& node, SuperKeysConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kdf_ops_limit = node["kdf_ops_limit"].as<unsigned long long>(2);
        rhs.kdf_mem_limit = node["kdf_mem_limit"].as<std::size_t>(64ull * 1024 * 1024);
        return true;
    }
};

template<>
struct convert<PolicyConfig> {
    static Node encode(const PolicyConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, PolicyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("/etc/keymaint/policy.yaml");
        return true;
    }
};

}
