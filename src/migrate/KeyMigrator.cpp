#include "migrate/KeyMigrator.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace km::migrate;
using namespace km::maintenance;
using namespace km::security;
using namespace km::types;

KeyMigrator::KeyMigrator(std::shared_ptr<db::KeyRepository> repo,
                         std::shared_ptr<KeystorePermissionOracle> oracle)
    : repo_(std::move(repo)), oracle_(std::move(oracle)) {}

bool KeyMigrator::hasKeyPermission(const CallerContext& caller, const Domain domain,
                                   const int64_t nspace, const KeyPerm perm) const {
    if (domain == Domain::App && static_cast<int64_t>(caller.uid) == nspace) return true;
    return oracle_->checkKeyPermission(caller, domain, nspace, perm);
}

Status KeyMigrator::migrateKeyNamespace(const CallerContext& caller,
                                        const KeyDescriptor& source,
                                        const KeyDescriptor& destination) {
    const auto src = MigrationSourceDomain::from(source.domain);
    if (!src) return Error::invalidArgument("Keys cannot be migrated from domain " + to_string(source.domain));

    const auto dst = MigrationDestinationDomain::from(destination.domain);
    if (!dst) return Error::invalidArgument("Keys cannot be migrated to domain " + to_string(destination.domain));

    if (!destination.alias || destination.alias->empty())
        return Error::invalidArgument("Migration destination requires an alias");

    if (src->get() != Domain::KeyId && (!source.alias || source.alias->empty()))
        return Error::invalidArgument("Migration source requires an alias");

    std::optional<KeyEntry> entry;
    try {
        entry = repo_->keyEntry(source);
    } catch (const std::exception& e) {
        log::Registry::migrate()->error("[KeyMigrator] Resolving {} failed: {}", to_string(source), e.what());
        return Error::systemError("Failed to resolve migration source");
    }
    if (!entry) return Error::keyNotFound("No key at " + to_string(source));

    for (const auto perm : {KeyPerm::Use, KeyPerm::Grant, KeyPerm::Delete}) {
        if (!hasKeyPermission(caller, entry->domain, entry->nspace, perm)) {
            log::Registry::auth()->warn("[KeyMigrator] uid {} lacks {} on {}:{}", caller.uid, to_string(perm),
                                        to_string(entry->domain), entry->nspace);
            return Error::permissionDenied(fmt::format("Caller lacks {} permission on the source namespace", to_string(perm)));
        }
    }

    if (!hasKeyPermission(caller, dst->get(), destination.nspace, KeyPerm::Rebind)) {
        log::Registry::auth()->warn("[KeyMigrator] uid {} lacks rebind on {}:{}", caller.uid,
                                    to_string(dst->get()), destination.nspace);
        return Error::permissionDenied("Caller lacks rebind permission on the destination namespace");
    }

    bool moved = false;
    try {
        moved = repo_->rebindKeyEntry(entry->id, dst->get(), destination.nspace, *destination.alias);
    } catch (const std::exception& e) {
        log::Registry::migrate()->error("[KeyMigrator] Rebinding key {} failed: {}", entry->id, e.what());
        return Error::systemError("Failed to migrate key");
    }

    if (!moved) {
        log::Registry::migrate()->info("[KeyMigrator] Destination {} is occupied, {} left in place",
                                       to_string(destination), to_string(*entry));
        return Error::invalidArgument("Destination alias already in use: " + to_string(destination));
    }

    log::Registry::migrate()->info("[KeyMigrator] Migrated key {} from {}:{} to {}", entry->id,
                                   to_string(entry->domain), entry->nspace, to_string(destination));
    return ok();
}
