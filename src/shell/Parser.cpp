#include "shell/Parser.hpp"

#include <charconv>

namespace km::shell {

CommandCall parseArgs(const std::vector<std::string>& args, const std::unordered_set<std::string>& boolFlags) {
    CommandCall call;
    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && a.size() > 2 && a.starts_with("--")) {
            auto key = a.substr(2);
            if (const auto eq = key.find('='); eq != std::string::npos) {
                setOpt(call, key.substr(0, eq), key.substr(eq + 1));
                continue;
            }
            if (!boolFlags.contains(key) && i + 1 < args.size() && !args[i + 1].starts_with("--")) {
                setOpt(call, key, args[i + 1]);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

std::optional<int64_t> parseInt(const std::string& text) {
    int64_t v{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (ec != std::errc() || ptr != end || text.empty()) return std::nullopt;
    return v;
}

std::optional<types::KeyDescriptor> parseDescriptor(const std::string& text) {
    const auto first = text.find(':');
    if (first == std::string::npos) return std::nullopt;

    const auto domain = types::domain_from_string(text.substr(0, first));
    if (!domain) return std::nullopt;

    const auto rest = text.substr(first + 1);
    const auto second = rest.find(':');

    types::KeyDescriptor desc;
    desc.domain = *domain;

    const auto ns = parseInt(second == std::string::npos ? rest : rest.substr(0, second));
    if (!ns) return std::nullopt;

    if (*domain == types::Domain::KeyId) {
        if (second != std::string::npos) return std::nullopt;
        desc.keyId = *ns;
        return desc;
    }

    desc.nspace = *ns;
    if (second != std::string::npos) desc.alias = rest.substr(second + 1);
    return desc;
}

std::optional<std::string> identityFlag(const CommandCall& call) {
    for (const auto* key : {"uid", "pid", "context"})
        if (call.hasFlag(key)) return std::string(key);
    return std::nullopt;
}

}
