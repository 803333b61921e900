#include "db/Schema.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

using namespace km::db;

void Schema::init(pqxx::connection& conn) {
    pqxx::work txn(conn);

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS keymaint_users (
            user_id     INTEGER PRIMARY KEY CHECK (user_id >= 0),
            state       TEXT NOT NULL,
            updated_at  TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP
        ))");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS keymaint_super_keys (
            user_id         INTEGER PRIMARY KEY,
            encrypted_key   BYTEA NOT NULL,
            iv              BYTEA NOT NULL,
            salt            BYTEA NOT NULL,
            security_level  TEXT NOT NULL,
            bound_key_blob  BYTEA NOT NULL,
            created_at      TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP
        ))");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS keymaint_key_entries (
            id                  BIGSERIAL PRIMARY KEY,
            domain              INTEGER NOT NULL,
            namespace           BIGINT NOT NULL,
            alias               TEXT,
            security_level      TEXT NOT NULL,
            blob                BYTEA NOT NULL,
            auth_bound          BOOLEAN NOT NULL DEFAULT FALSE,
            auth_sids           BIGINT[] NOT NULL DEFAULT '{}',
            rollback_resistant  BOOLEAN NOT NULL DEFAULT FALSE,
            early_boot_only     BOOLEAN NOT NULL DEFAULT FALSE,
            created_at          TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,
            UNIQUE (domain, namespace, alias)
        ))");

    txn.exec("CREATE INDEX IF NOT EXISTS keymaint_key_entries_ns_idx "
             "ON keymaint_key_entries (domain, namespace)");

    txn.exec("CREATE INDEX IF NOT EXISTS keymaint_key_entries_level_idx "
             "ON keymaint_key_entries (security_level)");

    txn.commit();
    log::Registry::db()->debug("[Schema] keymaint tables ready");
}
