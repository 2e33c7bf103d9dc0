#include "db/DBConnection.hpp"

void fdx::db::DBConnection::initPreparedSessions() const {
    conn_->prepare("get_session", "SELECT * FROM sessions WHERE id = $1");

    conn_->prepare("insert_session",
                   "INSERT INTO sessions (id, user_id, valid_until, created_at) "
                   "VALUES ($1, $2, $3::timestamp, $4::timestamp)");

    conn_->prepare("delete_session", "DELETE FROM sessions WHERE id = $1");

    conn_->prepare("list_expired_session_ids", "SELECT id FROM sessions WHERE valid_until <= $1::timestamp");

    conn_->prepare("list_session_ids_by_user", "SELECT id FROM sessions WHERE user_id = $1");

    conn_->prepare("delete_expired_sessions", "DELETE FROM sessions WHERE valid_until <= $1::timestamp");
}
