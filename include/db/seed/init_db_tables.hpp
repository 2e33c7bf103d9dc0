#pragma once

#include <pqxx/pqxx>

namespace fdx::db::seed {

inline void init_identities(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS users
(
    id             TEXT          PRIMARY KEY,
    username       VARCHAR(255)  UNIQUE NOT NULL,
    display_name   TEXT          NOT NULL,
    password_hash  TEXT          NOT NULL,
    created_at     TIMESTAMP     NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'),
    updated_at     TIMESTAMP     NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
);
    )");

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS sessions
(
    id           TEXT       PRIMARY KEY,
    user_id      TEXT       NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    valid_until  TIMESTAMP  NOT NULL,
    created_at   TIMESTAMP  NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS idx_sessions_valid_until ON sessions (valid_until);");
}

// parent_id carries no foreign key: top-level rows point at the 'root' sentinel,
// and hard deletes leave children in place.
inline void init_entries(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS entries
(
    id                    TEXT         PRIMARY KEY,
    name                  TEXT         NOT NULL,
    size                  BIGINT       NOT NULL DEFAULT 0,
    type                  VARCHAR(16)  NOT NULL CHECK (type IN ('file', 'directory', 'other')),
    status                VARCHAR(16)  NOT NULL CHECK (status IN ('pending', 'finalized')),
    author_id             TEXT         NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    parent_id             TEXT         NOT NULL DEFAULT 'root',
    is_deleted            BOOLEAN      NOT NULL DEFAULT FALSE,
    is_deleted_since      TIMESTAMP,
    permission            VARCHAR(32)  NOT NULL DEFAULT 'private',
    permission_inclusive  JSONB        NOT NULL DEFAULT '[]'::jsonb,
    created_at            TIMESTAMP    NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'),
    updated_at            TIMESTAMP    NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'),
    CHECK (is_deleted = (is_deleted_since IS NOT NULL))
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS idx_entries_parent_id ON entries (parent_id);");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_entries_author_id ON entries (author_id);");
}

inline void init_audit(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS transactions
(
    id          TEXT         PRIMARY KEY,
    entry_id    TEXT         NOT NULL REFERENCES entries (id) ON DELETE CASCADE,
    actor_id    TEXT         NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    action      VARCHAR(16)  NOT NULL,
    created_at  TIMESTAMP    NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_entry_id ON transactions (entry_id);");

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS tombstones
(
    id             TEXT       PRIMARY KEY,
    entry_id       TEXT       NOT NULL,
    entry_name     TEXT       NOT NULL,
    author_id      TEXT       NOT NULL,
    actor_id       TEXT       NOT NULL,
    purged_object  BOOLEAN    NOT NULL DEFAULT FALSE,
    created_at     TIMESTAMP  NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS idx_tombstones_entry_id ON tombstones (entry_id);");
}

inline void init_tables_if_not_exists(pqxx::work& txn) {
    init_identities(txn);
    init_entries(txn);
    init_audit(txn);
}

}
