#include "db/DBConnection.hpp"

void fdx::db::DBConnection::initPreparedEntries() const {
    conn_->prepare("get_entry", "SELECT * FROM entries WHERE id = $1");

    conn_->prepare("list_entries",
                   "SELECT * FROM entries "
                   "WHERE author_id = $1 AND status = 'finalized' "
                   "AND ($2 OR is_deleted = FALSE) "
                   "AND ($3::text IS NULL OR parent_id = $3::text) "
                   "ORDER BY created_at, name");

    conn_->prepare("list_entry_children",
                   "SELECT * FROM entries "
                   "WHERE parent_id IN (SELECT jsonb_array_elements_text($1::jsonb))");

    conn_->prepare("list_entry_ids_deleted_before",
                   "SELECT id FROM entries WHERE is_deleted = TRUE AND is_deleted_since < $1::timestamp");

    conn_->prepare("list_entry_ids_by_author", "SELECT id FROM entries WHERE author_id = $1");

    conn_->prepare("insert_entry",
                   R"SQL(
    INSERT INTO entries (id, name, size, type, status, author_id, parent_id,
                         is_deleted, is_deleted_since, permission, permission_inclusive,
                         created_at, updated_at)
    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::timestamp, $10, $11::jsonb, $12::timestamp, $13::timestamp)
    )SQL");

    conn_->prepare("update_entry",
                   R"SQL(
    UPDATE entries
    SET name                 = $2,
        size                 = $3,
        status               = $4,
        parent_id            = $5,
        permission           = $6,
        permission_inclusive = $7::jsonb,
        updated_at           = $8::timestamp
    WHERE id = $1
    )SQL");

    // closure cascade: one statement over the whole id set
    conn_->prepare("set_entries_deleted",
                   R"SQL(
    UPDATE entries
    SET is_deleted       = $2,
        is_deleted_since = $3::timestamp,
        updated_at       = $4::timestamp
    WHERE id IN (SELECT jsonb_array_elements_text($1::jsonb))
    )SQL");

    conn_->prepare("delete_entry", "DELETE FROM entries WHERE id = $1");
}
