#pragma once

#include "shell/types.hpp"
#include "types/Domain.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace km::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

/**
 * First non-flag word is the command name. "--key value" and "--key=value"
 * set options; keys listed in boolFlags never take a value. Everything after
 * a bare "--" is positional.
 */
CommandCall parseArgs(const std::vector<std::string>& args,
                      const std::unordered_set<std::string>& boolFlags = {});

// "app:10023:alias", "selinux:102:alias", "key_id:42"
std::optional<types::KeyDescriptor> parseDescriptor(const std::string& text);

std::optional<int64_t> parseInt(const std::string& text);

// First of --uid, --pid or --context present in call. The caller's identity is
// never taken from arguments, so keymaintctl rejects all of them.
std::optional<std::string> identityFlag(const CommandCall& call);

}
