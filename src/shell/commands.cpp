#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "maintenance/Maintenance.hpp"

#include <fmt/format.h>
#include <istream>
#include <limits>

using namespace km::shell;
using namespace km::maintenance;
using namespace km::types;

namespace {

CommandResult usageError(const std::string& msg) {
    CommandResult r;
    r.exit_code = EXIT_USAGE;
    r.stderr_text = msg + "\n";
    return r;
}

CommandResult fromStatus(const Status& s) {
    CommandResult r;
    if (!s) {
        r.exit_code = EXIT_MAINTENANCE_ERROR;
        r.stderr_text = fmt::format("{}: {}\n", to_string(s.error().code), s.error().message);
    }
    return r;
}

template <typename T>
CommandResult fromError(const Result<T>& res) {
    CommandResult r;
    r.exit_code = EXIT_MAINTENANCE_ERROR;
    r.stderr_text = fmt::format("{}: {}\n", to_string(res.error().code), res.error().message);
    return r;
}

std::optional<int32_t> userArg(const CommandCall& call, const size_t idx) {
    if (call.positionals.size() <= idx) return std::nullopt;
    const auto v = parseInt(call.positionals[idx]);
    if (!v || *v < std::numeric_limits<int32_t>::min() || *v > std::numeric_limits<int32_t>::max()) return std::nullopt;
    return static_cast<int32_t>(*v);
}

std::optional<std::vector<uint8_t>> readLine(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return std::vector<uint8_t>(line.begin(), line.end());
}

}

void km::shell::registerMaintenanceCommands(Router& router,
                                            std::shared_ptr<Maintenance> authority,
                                            const CallerContext& caller,
                                            std::istream& in) {
    const auto simpleUserCommand = [&](const std::string& name, const std::string& description,
                                       Status (Maintenance::*op)(const CallerContext&, int32_t)) {
        router.registerCommand(name, name + " <user>", description,
            [authority, caller, name, op](const CommandCall& call) {
                const auto user = userArg(call, 0);
                if (!user || call.positionals.size() != 1) return usageError("usage: " + name + " <user>");
                return fromStatus(((*authority).*op)(caller, *user));
            });
    };

    simpleUserCommand("user-added", "Reset a new user's key set", &Maintenance::onUserAdded);
    simpleUserCommand("user-removed", "Destroy every key of a user", &Maintenance::onUserRemoved);
    simpleUserCommand("lskf-removed", "Destroy a user's auth-bound keys", &Maintenance::onUserLskfRemoved);

    router.registerCommand("init-super-keys", "init-super-keys <user> [--allow-existing]",
        "Create a user's super keys (password on stdin)",
        [authority, caller, &in](const CommandCall& call) {
            const auto user = userArg(call, 0);
            if (!user || call.positionals.size() != 1) return usageError("usage: init-super-keys <user> [--allow-existing]");
            const auto password = readLine(in);
            if (!password) return usageError("init-super-keys: expected the password on stdin");
            return fromStatus(authority->initUserSuperKeys(caller, *user, *password, call.hasFlag("allow-existing")));
        });

    router.registerCommand("password-changed", "password-changed <user>",
        "Re-wrap a user's super key (old and new password on stdin)",
        [authority, caller, &in](const CommandCall& call) {
            const auto user = userArg(call, 0);
            if (!user || call.positionals.size() != 1) return usageError("usage: password-changed <user>");
            const auto oldPassword = readLine(in);
            const auto newPassword = oldPassword ? readLine(in) : std::nullopt;
            if (!newPassword) return usageError("password-changed: expected old and new password on stdin");
            return fromStatus(authority->onUserPasswordChanged(caller, *user, *oldPassword, *newPassword));
        });

    router.registerCommand("clear-namespace", "clear-namespace <app|selinux> <namespace>",
        "Destroy every key in a namespace",
        [authority, caller](const CommandCall& call) {
            if (call.positionals.size() != 2) return usageError("usage: clear-namespace <app|selinux> <namespace>");
            const auto domain = domain_from_string(call.positionals[0]);
            const auto nspace = parseInt(call.positionals[1]);
            if (!domain || !nspace) return usageError("clear-namespace: invalid domain or namespace");
            return fromStatus(authority->clearNamespace(caller, *domain, *nspace));
        });

    router.registerCommand("early-boot-ended", "early-boot-ended", "Notify every backend that early boot has ended",
        [authority, caller](const CommandCall& call) {
            if (!call.positionals.empty()) return usageError("usage: early-boot-ended");
            return fromStatus(authority->earlyBootEnded(caller));
        });

    router.registerCommand("delete-all-keys", "delete-all-keys", "Wipe every key on every backend",
        [authority, caller](const CommandCall& call) {
            if (!call.positionals.empty()) return usageError("usage: delete-all-keys");
            return fromStatus(authority->deleteAllKeys(caller));
        });

    router.registerCommand("migrate", "migrate <src> <dst>",
        "Move a key; descriptors are domain:namespace[:alias] or key_id:<id>",
        [authority, caller](const CommandCall& call) {
            if (call.positionals.size() != 2) return usageError("usage: migrate <src> <dst>");
            const auto src = parseDescriptor(call.positionals[0]);
            const auto dst = parseDescriptor(call.positionals[1]);
            if (!src || !dst) return usageError("migrate: malformed key descriptor");
            return fromStatus(authority->migrateKeyNamespace(caller, *src, *dst));
        });

    router.registerCommand("affected-uids", "affected-uids <user> <sid>",
        "List app uids with keys bound to a secure user id",
        [authority, caller](const CommandCall& call) {
            const auto user = userArg(call, 0);
            const auto sid = call.positionals.size() == 2 ? parseInt(call.positionals[1]) : std::nullopt;
            if (!user || !sid) return usageError("usage: affected-uids <user> <sid>");

            const auto res = authority->getAppUidsAffectedBySid(caller, *user, *sid);
            if (!res) return fromError(res);

            CommandResult r;
            for (const auto uid : res.value()) r.stdout_text += fmt::format("{}\n", uid);
            r.data = res.value();
            r.has_data = true;
            return r;
        });

    router.registerCommand("state", "state <user>", "Print a user's lifecycle state",
        [authority, caller](const CommandCall& call) {
            const auto user = userArg(call, 0);
            if (!user || call.positionals.size() != 1) return usageError("usage: state <user>");

            const auto res = authority->getState(caller, *user);
            if (!res) return fromError(res);

            CommandResult r;
            r.stdout_text = to_string(res.value()) + "\n";
            r.data = {{"user", *user}, {"state", to_string(res.value())}};
            r.has_data = true;
            return r;
        });
}
