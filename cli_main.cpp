// keymaintctl: runs one maintenance operation on behalf of the invoking process.

#include "backend/BackendSet.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/PgKeyRepository.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"
#include "maintenance/Maintenance.hpp"
#include "runtime/paths.hpp"
#include "security/PolicyOracle.hpp"
#include "security/ProcessCaller.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <iostream>
#include <vector>

using namespace km;

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto call = shell::parseArgs(args, {"allow-existing", "help"});

    if (call.hasFlag("help") || call.name.empty()) {
        // Handlers are never run here, the router only renders the command table.
        shell::Router router;
        shell::registerMaintenanceCommands(router, nullptr, {}, std::cin);
        fmt::print(stderr, "{}", router.usage());
        return call.hasFlag("help") ? shell::EXIT_OK : shell::EXIT_USAGE;
    }

    if (const auto flag = shell::identityFlag(call)) {
        fmt::print(stderr, "keymaintctl: --{} is not accepted, the caller is the invoking process\n", *flag);
        return shell::EXIT_USAGE;
    }

    const auto caller = security::processCaller();

    try {
        config::ConfigRegistry::init(call.flag("config") ? std::filesystem::path(*call.flag("config")) : paths::getConfigPath());
        const auto& cfg = config::ConfigRegistry::get();
        log::Registry::init(paths::getLogPath());

        db::Transactions::init(cfg.database, static_cast<size_t>(std::max(1, cfg.database.pool_size)));
        auto repo = std::make_shared<db::PgKeyRepository>();

        auto pool = std::make_shared<concurrency::ThreadPool>(cfg.backend.worker_threads);
        auto backends = backend::BackendSet::fromConfig(cfg.backend, pool);

        const auto policy = security::PolicyOracle::fromFile(cfg.policy.path);
        const auto authority = maintenance::Maintenance::create(repo, std::move(backends), policy, policy, cfg);

        shell::Router router;
        shell::registerMaintenanceCommands(router, authority, caller, std::cin);

        log::Registry::keymaint()->debug("[keymaintctl] uid {} runs '{}'", caller.uid, call.name);
        const auto result = router.execute(call);

        if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
        if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
        return result.exit_code;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::keymaint()->critical("[keymaintctl] Fatal: {}", e.what());
        fmt::print(stderr, "SystemError: {}\n", e.what());
        return shell::EXIT_MAINTENANCE_ERROR;
    }
}
