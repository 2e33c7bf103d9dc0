#include "db/MemoryStore.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace fdx::db;
using namespace fdx::fs::model;
using namespace fdx::audit::model;
using namespace fdx::identities::model;
using namespace fdx::auth::model;

namespace {

class MemoryWork final : public Work {
public:
    explicit MemoryWork(MemoryStore::Tables& t) : t_(t) {}

    std::optional<Entry> findEntry(const std::string& id) override {
        const auto it = t_.entries.find(id);
        if (it == t_.entries.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Entry> listEntries(const EntryFilter& filter) override {
        std::vector<Entry> out;
        for (const auto& [_, e] : t_.entries) {
            if (e.author_id != filter.author_id || !e.isFinalized()) continue;
            if (!filter.include_deleted && e.is_deleted) continue;
            if (filter.parent_id && e.parent_id != *filter.parent_id) continue;
            out.push_back(e);
        }
        std::ranges::sort(out, [](const Entry& a, const Entry& b) {
            if (a.created_at != b.created_at) return a.created_at < b.created_at;
            return a.name < b.name;
        });
        return out;
    }

    std::vector<Entry> listChildren(const std::vector<std::string>& parentIds) override {
        std::vector<Entry> out;
        for (const auto& [_, e] : t_.entries)
            if (std::ranges::find(parentIds, e.parent_id) != parentIds.end()) out.push_back(e);
        return out;
    }

    std::vector<std::string> listEntryIdsDeletedBefore(const std::time_t cutoff) override {
        std::vector<std::string> ids;
        for (const auto& [id, e] : t_.entries)
            if (e.is_deleted && e.is_deleted_since && *e.is_deleted_since < cutoff) ids.push_back(id);
        return ids;
    }

    std::vector<std::string> listEntryIdsByAuthor(const std::string& authorId) override {
        std::vector<std::string> ids;
        for (const auto& [id, e] : t_.entries)
            if (e.author_id == authorId) ids.push_back(id);
        return ids;
    }

    void insertEntry(const Entry& entry) override {
        if (t_.entries.contains(entry.id)) violation("duplicate key entries.id " + entry.id);
        if (!t_.users.contains(entry.author_id)) violation("entries.author_id references missing user " + entry.author_id);
        checkDeletedPair(entry);
        t_.entries.emplace(entry.id, entry);
    }

    void updateEntry(const Entry& entry) override {
        const auto it = t_.entries.find(entry.id);
        if (it == t_.entries.end()) return;
        auto& row = it->second;
        row.name = entry.name;
        row.size = entry.size;
        row.status = entry.status;
        row.parent_id = entry.parent_id;
        row.permission = entry.permission;
        row.permission_inclusive = entry.permission_inclusive;
        row.updated_at = entry.updated_at;
    }

    void setDeleted(const std::vector<std::string>& ids, const std::optional<std::time_t>& since,
                    const std::time_t updatedAt) override {
        for (const auto& id : ids) {
            const auto it = t_.entries.find(id);
            if (it == t_.entries.end()) continue;
            it->second.is_deleted = since.has_value();
            it->second.is_deleted_since = since;
            it->second.updated_at = updatedAt;
        }
    }

    void deleteEntry(const std::string& id) override {
        if (t_.entries.erase(id) == 0) return;
        std::erase_if(t_.transactions, [&](const Transaction& txn) { return txn.entry_id == id; });
    }

    void insertTransaction(const Transaction& txn) override {
        if (!t_.entries.contains(txn.entry_id)) violation("transactions.entry_id references missing entry " + txn.entry_id);
        if (!t_.users.contains(txn.actor_id)) violation("transactions.actor_id references missing user " + txn.actor_id);
        t_.transactions.push_back(txn);
    }

    std::vector<Transaction> listTransactions(const std::string& entryId) override {
        std::vector<Transaction> out;
        for (const auto& txn : t_.transactions)
            if (txn.entry_id == entryId) out.push_back(txn);
        std::ranges::stable_sort(out, {}, &Transaction::created_at);
        return out;
    }

    void insertTombstone(const Tombstone& tombstone) override { t_.tombstones.push_back(tombstone); }

    std::vector<Tombstone> listTombstones(const std::string& entryId) override {
        std::vector<Tombstone> out;
        for (const auto& t : t_.tombstones)
            if (t.entry_id == entryId) out.push_back(t);
        return out;
    }

    std::optional<User> findUser(const std::string& id) override {
        const auto it = t_.users.find(id);
        if (it == t_.users.end()) return std::nullopt;
        return it->second;
    }

    std::optional<User> findUserByName(const std::string& username) override {
        for (const auto& [_, u] : t_.users)
            if (u.username == username) return u;
        return std::nullopt;
    }

    std::vector<User> listUsers() override {
        std::vector<User> out;
        for (const auto& [_, u] : t_.users) out.push_back(u);
        std::ranges::sort(out, {}, &User::username);
        return out;
    }

    void insertUser(const User& user) override {
        if (t_.users.contains(user.id)) violation("duplicate key users.id " + user.id);
        if (findUserByName(user.username)) violation("duplicate key users.username " + user.username);
        t_.users.emplace(user.id, user);
    }

    void updateUser(const User& user) override {
        const auto it = t_.users.find(user.id);
        if (it == t_.users.end()) return;
        if (const auto other = findUserByName(user.username); other && other->id != user.id)
            violation("duplicate key users.username " + user.username);
        auto& row = it->second;
        row.username = user.username;
        row.display_name = user.display_name;
        row.password_hash = user.password_hash;
        row.updated_at = user.updated_at;
    }

    void deleteUser(const std::string& id) override {
        if (t_.users.erase(id) == 0) return;
        for (const auto& entryId : listEntryIdsByAuthor(id)) deleteEntry(entryId);
        std::erase_if(t_.transactions, [&](const Transaction& txn) { return txn.actor_id == id; });
        std::erase_if(t_.sessions, [&](const auto& kv) { return kv.second.user_id == id; });
    }

    std::optional<Session> findSession(const std::string& id) override {
        const auto it = t_.sessions.find(id);
        if (it == t_.sessions.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> listExpiredSessionIds(const std::time_t now) override {
        std::vector<std::string> ids;
        for (const auto& [id, s] : t_.sessions)
            if (s.isExpired(now)) ids.push_back(id);
        return ids;
    }

    std::vector<std::string> listSessionIdsByUser(const std::string& userId) override {
        std::vector<std::string> ids;
        for (const auto& [id, s] : t_.sessions)
            if (s.user_id == userId) ids.push_back(id);
        return ids;
    }

    void insertSession(const Session& session) override {
        if (t_.sessions.contains(session.id)) violation("duplicate key sessions.id " + session.id);
        if (!t_.users.contains(session.user_id)) violation("sessions.user_id references missing user " + session.user_id);
        t_.sessions.emplace(session.id, session);
    }

    void deleteSession(const std::string& id) override { t_.sessions.erase(id); }

    std::size_t deleteExpiredSessions(const std::time_t now) override {
        return std::erase_if(t_.sessions, [&](const auto& kv) { return kv.second.isExpired(now); });
    }

private:
    MemoryStore::Tables& t_;

    [[noreturn]] static void violation(const std::string& what) {
        throw std::runtime_error("constraint violation: " + what);
    }

    static void checkDeletedPair(const Entry& e) {
        if (e.is_deleted != e.is_deleted_since.has_value())
            violation("entries.is_deleted_since must be set iff is_deleted (" + e.id + ")");
    }
};

}

MemoryStore::Tables MemoryStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return tables_;
}

void MemoryStore::run(const std::string& ctx, const std::function<void(Work&)>& fn) {
    log::Registry::db()->trace("[MemoryStore::run] Starting transaction: {}", ctx);
    std::lock_guard lock(mutex_);

    auto staged = tables_;
    try {
        MemoryWork work(staged);
        fn(work);
    } catch (const error::Error& e) {
        log::Registry::db()->debug("[MemoryStore::run] Rolled back '{}': {}", ctx, e.what());
        throw;
    } catch (const std::exception& e) {
        log::Registry::db()->error("[MemoryStore::run] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
        throw;
    }

    tables_ = std::move(staged);
    log::Registry::db()->trace("[MemoryStore::run] Transaction committed: {}", ctx);
}
