#include "db/DBConnection.hpp"

void fdx::db::DBConnection::initPreparedUsers() const {
    conn_->prepare("get_user", "SELECT * FROM users WHERE id = $1");

    conn_->prepare("get_user_by_name", "SELECT * FROM users WHERE username = $1");

    conn_->prepare("list_users", "SELECT * FROM users ORDER BY username");

    conn_->prepare("insert_user",
                   "INSERT INTO users (id, username, display_name, password_hash, created_at, updated_at) "
                   "VALUES ($1, $2, $3, $4, $5::timestamp, $6::timestamp)");

    conn_->prepare("update_user",
                   "UPDATE users SET username = $2, display_name = $3, password_hash = $4, updated_at = $5::timestamp "
                   "WHERE id = $1");

    conn_->prepare("delete_user", "DELETE FROM users WHERE id = $1");
}
