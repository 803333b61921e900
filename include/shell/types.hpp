#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace km::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] bool hasFlag(const std::string& key) const {
        for (const auto& [k, _] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> flag(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return v;
        return std::nullopt;
    }
};

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_MAINTENANCE_ERROR = 1,
    EXIT_USAGE = 2,
};

struct CommandResult {
    int exit_code = EXIT_OK;
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;
    std::string description;
    CommandHandler handler;
};

}
