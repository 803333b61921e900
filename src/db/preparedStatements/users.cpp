#include "db/DBConnection.hpp"

using namespace km::db;

void DBConnection::initPreparedUsers() const {
    conn_->prepare("get_user_state", "SELECT state FROM keymaint_users WHERE user_id = $1");

    conn_->prepare("upsert_user_state",
                   "INSERT INTO keymaint_users (user_id, state) VALUES ($1, $2) "
                   "ON CONFLICT (user_id) DO UPDATE SET state = EXCLUDED.state, updated_at = NOW()");

    conn_->prepare("delete_user", "DELETE FROM keymaint_users WHERE user_id = $1");

    conn_->prepare("demote_users_at_level",
                   "UPDATE keymaint_users SET state = 'active_no_keys', updated_at = NOW() "
                   "WHERE user_id IN (SELECT user_id FROM keymaint_super_keys WHERE security_level = $1)");
}

void DBConnection::initPreparedSuperKeys() const {
    conn_->prepare("get_super_keys",
                   "SELECT user_id, encrypted_key, iv, salt, security_level, bound_key_blob, "
                   "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at "
                   "FROM keymaint_super_keys WHERE user_id = $1");

    conn_->prepare("insert_super_keys",
                   "INSERT INTO keymaint_super_keys (user_id, encrypted_key, iv, salt, security_level, bound_key_blob) "
                   "VALUES ($1, $2, $3, $4, $5, $6)");

    conn_->prepare("delete_super_keys", "DELETE FROM keymaint_super_keys WHERE user_id = $1");

    conn_->prepare("delete_super_keys_at_level", "DELETE FROM keymaint_super_keys WHERE security_level = $1");
}
