#include "db/PgKeyRepository.hpp"
#include "db/Transactions.hpp"
#include "db/encoding/bytea.hpp"

#include <stdexcept>

using namespace km::db;
using namespace km::db::encoding;
using namespace km::types;

namespace {

SecurityLevel parseLevel(const pqxx::field& f) {
    const auto str = f.as<std::string>();
    const auto level = security_level_from_string(str);
    if (!level) throw std::runtime_error("Unknown security level in database: " + str);
    return *level;
}

KeyEntry entryFromRow(const pqxx::row& row) {
    KeyEntry e;
    e.id = row["id"].as<int64_t>();
    e.domain = static_cast<Domain>(row["domain"].as<int32_t>());
    e.nspace = row["namespace"].as<int64_t>();
    if (!row["alias"].is_null()) e.alias = row["alias"].as<std::string>();
    e.security_level = parseLevel(row["security_level"]);
    e.blob = from_hex_bytea(row["blob"].as<std::string>());
    e.authorizations.auth_bound = row["auth_bound"].as<bool>();
    e.authorizations.auth_sids = from_bigint_array(row["auth_sids"].as<std::string>());
    e.authorizations.rollback_resistant = row["rollback_resistant"].as<bool>();
    e.authorizations.early_boot_only = row["early_boot_only"].as<bool>();
    e.created_at = static_cast<std::time_t>(row["created_at"].as<int64_t>());
    return e;
}

SuperKeySet superKeysFromRow(const pqxx::row& row) {
    SuperKeySet s;
    s.user_id = row["user_id"].as<int32_t>();
    s.encrypted_key = from_hex_bytea(row["encrypted_key"].as<std::string>());
    s.iv = from_hex_bytea(row["iv"].as<std::string>());
    s.salt = from_hex_bytea(row["salt"].as<std::string>());
    s.security_level = parseLevel(row["security_level"]);
    s.bound_key_blob = from_hex_bytea(row["bound_key_blob"].as<std::string>());
    s.created_at = static_cast<std::time_t>(row["created_at"].as<int64_t>());
    return s;
}

std::vector<KeyEntry> entriesFromResult(const pqxx::result& res) {
    std::vector<KeyEntry> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(entryFromRow(row));
    return out;
}

}

UserState PgKeyRepository::userState(const int32_t userId) {
    return Transactions::exec("PgKeyRepository::userState", [&](pqxx::work& txn) -> UserState {
        const auto res = txn.exec(pqxx::prepped{"get_user_state"}, userId);
        if (res.empty()) return UserState::Absent;
        const auto str = res.one_field().as<std::string>();
        const auto state = user_state_from_string(str);
        if (!state) throw std::runtime_error("Unknown user state in database: " + str);
        return *state;
    });
}

std::optional<SuperKeySet> PgKeyRepository::superKeySet(const int32_t userId) {
    return Transactions::exec("PgKeyRepository::superKeySet", [&](pqxx::work& txn) -> std::optional<SuperKeySet> {
        const auto res = txn.exec(pqxx::prepped{"get_super_keys"}, userId);
        if (res.empty()) return std::nullopt;
        return superKeysFromRow(res.one_row());
    });
}

int64_t PgKeyRepository::insertKeyEntry(const KeyEntry& entry) {
    return Transactions::exec("PgKeyRepository::insertKeyEntry", [&](pqxx::work& txn) -> int64_t {
        const auto& a = entry.authorizations;
        pqxx::params p{static_cast<int32_t>(entry.domain), entry.nspace, entry.alias,
                       to_string(entry.security_level), to_hex_bytea(entry.blob),
                       a.auth_bound, to_bigint_array(a.auth_sids), a.rollback_resistant, a.early_boot_only};
        return txn.exec(pqxx::prepped{"insert_key_entry"}, p).one_field().as<int64_t>();
    });
}

std::optional<KeyEntry> PgKeyRepository::keyEntry(const KeyDescriptor& desc) {
    return Transactions::exec("PgKeyRepository::keyEntry", [&](pqxx::work& txn) -> std::optional<KeyEntry> {
        pqxx::result res;
        if (desc.domain == Domain::KeyId) {
            res = txn.exec(pqxx::prepped{"get_key_entry_by_id"}, desc.resolvedKeyId());
        } else {
            if (!desc.alias) return std::nullopt;
            res = txn.exec(pqxx::prepped{"get_key_entry_by_alias"},
                           pqxx::params{static_cast<int32_t>(desc.domain), desc.nspace, *desc.alias});
        }
        if (res.empty()) return std::nullopt;
        return entryFromRow(res.one_row());
    });
}

std::vector<KeyEntry> PgKeyRepository::listNamespace(const Domain domain, const int64_t nspace) {
    return Transactions::exec("PgKeyRepository::listNamespace", [&](pqxx::work& txn) {
        return entriesFromResult(txn.exec(pqxx::prepped{"list_namespace_entries"},
                                          pqxx::params{static_cast<int32_t>(domain), nspace}));
    });
}

std::vector<KeyEntry> PgKeyRepository::listUserEntries(const int32_t userId, const bool authBoundOnly) {
    return Transactions::exec("PgKeyRepository::listUserEntries", [&](pqxx::work& txn) {
        return entriesFromResult(txn.exec(pqxx::prepped{"list_user_entries"},
                                          pqxx::params{first_uid_of_user(userId), end_uid_of_user(userId), authBoundOnly}));
    });
}

std::vector<int64_t> PgKeyRepository::namespacesBoundToSid(const int32_t userId, const int64_t sid) {
    return Transactions::exec("PgKeyRepository::namespacesBoundToSid", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"namespaces_bound_to_sid"},
                                  pqxx::params{first_uid_of_user(userId), end_uid_of_user(userId), sid});
        std::vector<int64_t> out;
        out.reserve(res.size());
        for (const auto& row : res) out.push_back(row["namespace"].as<int64_t>());
        return out;
    });
}

bool PgKeyRepository::rebindKeyEntry(const int64_t id, const Domain domain, const int64_t nspace, const std::string& alias) {
    return Transactions::exec("PgKeyRepository::rebindKeyEntry", [&](pqxx::work& txn) -> bool {
        const auto taken = txn.exec(pqxx::prepped{"key_alias_taken"},
                                    pqxx::params{static_cast<int32_t>(domain), nspace, alias, id}).one_field().as<bool>();
        if (taken) return false;

        const auto res = txn.exec(pqxx::prepped{"rebind_key_entry"},
                                  pqxx::params{id, static_cast<int32_t>(domain), nspace, alias});
        if (res.affected_rows() != 1) throw std::runtime_error("Key entry vanished during rebind: " + std::to_string(id));
        return true;
    });
}

void PgKeyRepository::wipeSecurityLevel(const SecurityLevel level) {
    Transactions::exec("PgKeyRepository::wipeSecurityLevel", [&](pqxx::work& txn) {
        const auto lvl = to_string(level);
        txn.exec(pqxx::prepped{"demote_users_at_level"}, lvl);
        txn.exec(pqxx::prepped{"delete_super_keys_at_level"}, lvl);
        txn.exec(pqxx::prepped{"delete_key_entries_at_level"}, lvl);
    });
}

void PgKeyRepository::commit(const ChangeSet& changes) {
    if (changes.empty()) return;

    Transactions::exec("PgKeyRepository::commit", [&](pqxx::work& txn) {
        for (const auto id : changes.deleteEntries)
            txn.exec(pqxx::prepped{"delete_key_entry"}, id);

        for (const auto userId : changes.deleteSuperKeys)
            txn.exec(pqxx::prepped{"delete_super_keys"}, userId);

        if (const auto& s = changes.putSuperKeys) {
            pqxx::params p{s->user_id, to_hex_bytea(s->encrypted_key), to_hex_bytea(s->iv), to_hex_bytea(s->salt),
                           to_string(s->security_level), to_hex_bytea(s->bound_key_blob)};
            txn.exec(pqxx::prepped{"insert_super_keys"}, p);
        }

        for (const auto& [userId, state] : changes.userStates) {
            if (state) txn.exec(pqxx::prepped{"upsert_user_state"}, pqxx::params{userId, to_string(*state)});
            else txn.exec(pqxx::prepped{"delete_user"}, userId);
        }
    });
}
