#include "db/DBConnection.hpp"

void fdx::db::DBConnection::initPreparedTransactions() const {
    conn_->prepare("insert_transaction",
                   "INSERT INTO transactions (id, entry_id, actor_id, action, created_at) "
                   "VALUES ($1, $2, $3, $4, $5::timestamp)");

    conn_->prepare("list_transactions_by_entry",
                   "SELECT * FROM transactions WHERE entry_id = $1 ORDER BY created_at, id");

    conn_->prepare("insert_tombstone",
                   "INSERT INTO tombstones (id, entry_id, entry_name, author_id, actor_id, purged_object, created_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamp)");

    conn_->prepare("list_tombstones_by_entry",
                   "SELECT * FROM tombstones WHERE entry_id = $1 ORDER BY created_at, id");
}
