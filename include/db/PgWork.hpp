#pragma once

#include "db/Store.hpp"

#include <pqxx/pqxx>

namespace fdx::db {

// Work over one open pqxx transaction. Every call goes through a prepared statement.
class PgWork final : public Work {
public:
    explicit PgWork(pqxx::work& txn) : txn_(txn) {}

    std::optional<fs::model::Entry> findEntry(const std::string& id) override;
    std::vector<fs::model::Entry> listEntries(const fs::model::EntryFilter& filter) override;
    std::vector<fs::model::Entry> listChildren(const std::vector<std::string>& parentIds) override;
    std::vector<std::string> listEntryIdsDeletedBefore(std::time_t cutoff) override;
    std::vector<std::string> listEntryIdsByAuthor(const std::string& authorId) override;
    void insertEntry(const fs::model::Entry& entry) override;
    void updateEntry(const fs::model::Entry& entry) override;
    void setDeleted(const std::vector<std::string>& ids, const std::optional<std::time_t>& since, std::time_t updatedAt) override;
    void deleteEntry(const std::string& id) override;

    void insertTransaction(const audit::model::Transaction& txn) override;
    std::vector<audit::model::Transaction> listTransactions(const std::string& entryId) override;
    void insertTombstone(const audit::model::Tombstone& tombstone) override;
    std::vector<audit::model::Tombstone> listTombstones(const std::string& entryId) override;

    std::optional<identities::model::User> findUser(const std::string& id) override;
    std::optional<identities::model::User> findUserByName(const std::string& username) override;
    std::vector<identities::model::User> listUsers() override;
    void insertUser(const identities::model::User& user) override;
    void updateUser(const identities::model::User& user) override;
    void deleteUser(const std::string& id) override;

    std::optional<auth::model::Session> findSession(const std::string& id) override;
    std::vector<std::string> listExpiredSessionIds(std::time_t now) override;
    std::vector<std::string> listSessionIdsByUser(const std::string& userId) override;
    void insertSession(const auth::model::Session& session) override;
    void deleteSession(const std::string& id) override;
    std::size_t deleteExpiredSessions(std::time_t now) override;

private:
    pqxx::work& txn_;
};

}
