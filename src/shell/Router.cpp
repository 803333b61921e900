#include "shell/Router.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <cctype>

using namespace km::shell;

void Router::registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler) {
    const auto key = normalize(name);
    if (commands_.contains(key))
        log::Registry::keymaint()->warn("[Router] Command '{}' registered twice, replacing", key);

    commands_[key] = CommandInfo{std::move(usage),
                                 description.empty() ? "No description provided." : std::move(description),
                                 std::move(handler)};
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid("No command provided.");

    const auto key = normalize(call.name);
    const auto it = commands_.find(key);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command: {}", call.name));

    log::Registry::keymaint()->debug("[Router] Executing command: '{}'", key);
    return it->second.handler(call);
}

std::string Router::usage() const {
    std::string out = "usage: keymaintctl [--config <path>] <command> [args]\n\ncommands:\n";
    for (const auto& [_, info] : commands_)
        out += fmt::format("  {:<48} {}\n", info.usage, info.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(c)));
    return out;
}

CommandResult Router::invalid(const std::string& msg) const {
    CommandResult r;
    r.exit_code = EXIT_USAGE;
    r.stderr_text = msg + "\n\n" + usage();
    return r;
}
