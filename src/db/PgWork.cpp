#include "db/PgWork.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace fdx::db;
using namespace fdx::fs::model;
using namespace fdx::audit::model;
using namespace fdx::identities::model;
using namespace fdx::auth::model;
using namespace fdx::util;

namespace {

std::string toJsonArray(const std::vector<std::string>& values) { return nlohmann::json(values).dump(); }

std::vector<std::string> ids_from_pq_res(const pqxx::result& res) {
    std::vector<std::string> ids;
    ids.reserve(res.size());
    for (const auto& row : res) ids.emplace_back(row["id"].as<std::string>());
    return ids;
}

std::optional<std::string> toOptionalTimestamp(const std::optional<std::time_t>& ts) {
    if (!ts) return std::nullopt;
    return toPostgresTimestamp(*ts);
}

}

std::optional<Entry> PgWork::findEntry(const std::string& id) {
    const auto res = txn_.exec(pqxx::prepped{"get_entry"}, pqxx::params{id});
    if (res.empty()) return std::nullopt;
    return Entry(res.one_row());
}

std::vector<Entry> PgWork::listEntries(const EntryFilter& filter) {
    pqxx::params p{filter.author_id, filter.include_deleted, filter.parent_id};
    return entries_from_pq_res(txn_.exec(pqxx::prepped{"list_entries"}, p));
}

std::vector<Entry> PgWork::listChildren(const std::vector<std::string>& parentIds) {
    if (parentIds.empty()) return {};
    return entries_from_pq_res(txn_.exec(pqxx::prepped{"list_entry_children"}, pqxx::params{toJsonArray(parentIds)}));
}

std::vector<std::string> PgWork::listEntryIdsDeletedBefore(const std::time_t cutoff) {
    return ids_from_pq_res(txn_.exec(pqxx::prepped{"list_entry_ids_deleted_before"},
                                     pqxx::params{toPostgresTimestamp(cutoff)}));
}

std::vector<std::string> PgWork::listEntryIdsByAuthor(const std::string& authorId) {
    return ids_from_pq_res(txn_.exec(pqxx::prepped{"list_entry_ids_by_author"}, pqxx::params{authorId}));
}

void PgWork::insertEntry(const Entry& entry) {
    pqxx::params p{
        entry.id,
        entry.name,
        static_cast<int64_t>(entry.size),
        to_string(entry.type),
        to_string(entry.status),
        entry.author_id,
        entry.parent_id,
        entry.is_deleted,
        toOptionalTimestamp(entry.is_deleted_since),
        rbac::to_string(entry.permission),
        toJsonArray(entry.permission_inclusive),
        toPostgresTimestamp(entry.created_at),
        toPostgresTimestamp(entry.updated_at)
    };
    txn_.exec(pqxx::prepped{"insert_entry"}, p);
}

void PgWork::updateEntry(const Entry& entry) {
    pqxx::params p{
        entry.id,
        entry.name,
        static_cast<int64_t>(entry.size),
        to_string(entry.status),
        entry.parent_id,
        rbac::to_string(entry.permission),
        toJsonArray(entry.permission_inclusive),
        toPostgresTimestamp(entry.updated_at)
    };
    txn_.exec(pqxx::prepped{"update_entry"}, p);
}

void PgWork::setDeleted(const std::vector<std::string>& ids, const std::optional<std::time_t>& since,
                        const std::time_t updatedAt) {
    if (ids.empty()) return;
    pqxx::params p{toJsonArray(ids), since.has_value(), toOptionalTimestamp(since), toPostgresTimestamp(updatedAt)};
    txn_.exec(pqxx::prepped{"set_entries_deleted"}, p);
}

void PgWork::deleteEntry(const std::string& id) {
    txn_.exec(pqxx::prepped{"delete_entry"}, pqxx::params{id});
}

void PgWork::insertTransaction(const Transaction& txn) {
    pqxx::params p{txn.id, txn.entry_id, txn.actor_id, to_string(txn.action), toPostgresTimestamp(txn.created_at)};
    txn_.exec(pqxx::prepped{"insert_transaction"}, p);
}

std::vector<Transaction> PgWork::listTransactions(const std::string& entryId) {
    return transactions_from_pq_res(txn_.exec(pqxx::prepped{"list_transactions_by_entry"}, pqxx::params{entryId}));
}

void PgWork::insertTombstone(const Tombstone& tombstone) {
    pqxx::params p{
        tombstone.id,
        tombstone.entry_id,
        tombstone.entry_name,
        tombstone.author_id,
        tombstone.actor_id,
        tombstone.purged_object,
        toPostgresTimestamp(tombstone.created_at)
    };
    txn_.exec(pqxx::prepped{"insert_tombstone"}, p);
}

std::vector<Tombstone> PgWork::listTombstones(const std::string& entryId) {
    return tombstones_from_pq_res(txn_.exec(pqxx::prepped{"list_tombstones_by_entry"}, pqxx::params{entryId}));
}

std::optional<User> PgWork::findUser(const std::string& id) {
    const auto res = txn_.exec(pqxx::prepped{"get_user"}, pqxx::params{id});
    if (res.empty()) return std::nullopt;
    return User(res.one_row());
}

std::optional<User> PgWork::findUserByName(const std::string& username) {
    const auto res = txn_.exec(pqxx::prepped{"get_user_by_name"}, pqxx::params{username});
    if (res.empty()) return std::nullopt;
    return User(res.one_row());
}

std::vector<User> PgWork::listUsers() {
    return users_from_pq_res(txn_.exec(pqxx::prepped{"list_users"}));
}

void PgWork::insertUser(const User& user) {
    pqxx::params p{
        user.id,
        user.username,
        user.display_name,
        user.password_hash,
        toPostgresTimestamp(user.created_at),
        toPostgresTimestamp(user.updated_at)
    };
    txn_.exec(pqxx::prepped{"insert_user"}, p);
}

void PgWork::updateUser(const User& user) {
    pqxx::params p{user.id, user.username, user.display_name, user.password_hash, toPostgresTimestamp(user.updated_at)};
    txn_.exec(pqxx::prepped{"update_user"}, p);
}

void PgWork::deleteUser(const std::string& id) {
    txn_.exec(pqxx::prepped{"delete_user"}, pqxx::params{id});
}

std::optional<Session> PgWork::findSession(const std::string& id) {
    const auto res = txn_.exec(pqxx::prepped{"get_session"}, pqxx::params{id});
    if (res.empty()) return std::nullopt;
    return Session(res.one_row());
}

std::vector<std::string> PgWork::listExpiredSessionIds(const std::time_t now) {
    return ids_from_pq_res(txn_.exec(pqxx::prepped{"list_expired_session_ids"}, pqxx::params{toPostgresTimestamp(now)}));
}

std::vector<std::string> PgWork::listSessionIdsByUser(const std::string& userId) {
    return ids_from_pq_res(txn_.exec(pqxx::prepped{"list_session_ids_by_user"}, pqxx::params{userId}));
}

void PgWork::insertSession(const Session& session) {
    pqxx::params p{session.id, session.user_id, toPostgresTimestamp(session.valid_until),
                   toPostgresTimestamp(session.created_at)};
    txn_.exec(pqxx::prepped{"insert_session"}, p);
}

void PgWork::deleteSession(const std::string& id) {
    txn_.exec(pqxx::prepped{"delete_session"}, pqxx::params{id});
}

std::size_t PgWork::deleteExpiredSessions(const std::time_t now) {
    const auto res = txn_.exec(pqxx::prepped{"delete_expired_sessions"}, pqxx::params{toPostgresTimestamp(now)});
    return static_cast<std::size_t>(res.affected_rows());
}
