#include "db/DBConnection.hpp"

using namespace km::db;

void DBConnection::initPreparedKeyEntries() const {
    static constexpr auto COLUMNS =
        "id, domain, namespace, alias, security_level, blob, auth_bound, auth_sids, "
        "rollback_resistant, early_boot_only, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at ";

    conn_->prepare("insert_key_entry",
                   "INSERT INTO keymaint_key_entries "
                   "(domain, namespace, alias, security_level, blob, auth_bound, auth_sids, rollback_resistant, early_boot_only) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7::BIGINT[], $8, $9) RETURNING id");

    conn_->prepare("get_key_entry_by_alias",
                   std::string("SELECT ") + COLUMNS +
                   "FROM keymaint_key_entries WHERE domain = $1 AND namespace = $2 AND alias = $3");

    conn_->prepare("get_key_entry_by_id",
                   std::string("SELECT ") + COLUMNS + "FROM keymaint_key_entries WHERE id = $1");

    conn_->prepare("list_namespace_entries",
                   std::string("SELECT ") + COLUMNS +
                   "FROM keymaint_key_entries WHERE domain = $1 AND namespace = $2 ORDER BY id");

    // $1/$2 bound the user's app uid range, $3 restricts to auth-bound entries
    conn_->prepare("list_user_entries",
                   std::string("SELECT ") + COLUMNS +
                   "FROM keymaint_key_entries "
                   "WHERE domain = 0 AND namespace >= $1 AND namespace < $2 AND (NOT $3 OR auth_bound) "
                   "ORDER BY id");

    conn_->prepare("namespaces_bound_to_sid",
                   "SELECT DISTINCT namespace FROM keymaint_key_entries "
                   "WHERE domain = 0 AND namespace >= $1 AND namespace < $2 "
                   "AND auth_bound AND $3 = ANY(auth_sids) "
                   "ORDER BY namespace");

    conn_->prepare("key_alias_taken",
                   "SELECT EXISTS(SELECT 1 FROM keymaint_key_entries "
                   "WHERE domain = $1 AND namespace = $2 AND alias = $3 AND id <> $4)");

    conn_->prepare("rebind_key_entry",
                   "UPDATE keymaint_key_entries SET domain = $2, namespace = $3, alias = $4 WHERE id = $1");

    conn_->prepare("delete_key_entry", "DELETE FROM keymaint_key_entries WHERE id = $1");

    conn_->prepare("delete_key_entries_at_level", "DELETE FROM keymaint_key_entries WHERE security_level = $1");
}
