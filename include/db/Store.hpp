#pragma once

#include "fs/model/Entry.hpp"
#include "audit/model/Transaction.hpp"
#include "audit/model/Tombstone.hpp"
#include "identities/model/User.hpp"
#include "auth/model/Session.hpp"

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fdx::db {

// One atomic unit against the store. Everything staged through a Work either
// commits together or not at all.
class Work {
public:
    virtual ~Work() = default;

    // entries
    [[nodiscard]] virtual std::optional<fs::model::Entry> findEntry(const std::string& id) = 0;
    [[nodiscard]] virtual std::vector<fs::model::Entry> listEntries(const fs::model::EntryFilter& filter) = 0;
    [[nodiscard]] virtual std::vector<fs::model::Entry> listChildren(const std::vector<std::string>& parentIds) = 0;
    [[nodiscard]] virtual std::vector<std::string> listEntryIdsDeletedBefore(std::time_t cutoff) = 0;
    [[nodiscard]] virtual std::vector<std::string> listEntryIdsByAuthor(const std::string& authorId) = 0;
    virtual void insertEntry(const fs::model::Entry& entry) = 0;
    virtual void updateEntry(const fs::model::Entry& entry) = 0;
    virtual void setDeleted(const std::vector<std::string>& ids, const std::optional<std::time_t>& since, std::time_t updatedAt) = 0;
    virtual void deleteEntry(const std::string& id) = 0;

    // audit
    virtual void insertTransaction(const audit::model::Transaction& txn) = 0;
    [[nodiscard]] virtual std::vector<audit::model::Transaction> listTransactions(const std::string& entryId) = 0;
    virtual void insertTombstone(const audit::model::Tombstone& tombstone) = 0;
    [[nodiscard]] virtual std::vector<audit::model::Tombstone> listTombstones(const std::string& entryId) = 0;

    // users
    [[nodiscard]] virtual std::optional<identities::model::User> findUser(const std::string& id) = 0;
    [[nodiscard]] virtual std::optional<identities::model::User> findUserByName(const std::string& username) = 0;
    [[nodiscard]] virtual std::vector<identities::model::User> listUsers() = 0;
    virtual void insertUser(const identities::model::User& user) = 0;
    virtual void updateUser(const identities::model::User& user) = 0;
    virtual void deleteUser(const std::string& id) = 0;

    // sessions
    [[nodiscard]] virtual std::optional<auth::model::Session> findSession(const std::string& id) = 0;
    [[nodiscard]] virtual std::vector<std::string> listExpiredSessionIds(std::time_t now) = 0;
    [[nodiscard]] virtual std::vector<std::string> listSessionIdsByUser(const std::string& userId) = 0;
    virtual void insertSession(const auth::model::Session& session) = 0;
    virtual void deleteSession(const std::string& id) = 0;
    virtual std::size_t deleteExpiredSessions(std::time_t now) = 0;
};

class Store {
public:
    virtual ~Store() = default;

    // Runs func inside one unit of work. The unit commits when func returns and
    // rolls back when it throws; the exception is rethrown unchanged.
    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Work&>())) {
        using Result = decltype(func(std::declval<Work&>()));

        if constexpr (std::is_void_v<Result>) {
            run(ctx, [&](Work& work) { func(work); });
        } else {
            std::optional<Result> result;
            run(ctx, [&](Work& work) { result.emplace(func(work)); });
            return std::move(*result);
        }
    }

protected:
    virtual void run(const std::string& ctx, const std::function<void(Work&)>& fn) = 0;
};

}
