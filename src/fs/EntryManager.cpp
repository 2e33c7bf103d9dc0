#include "fs/EntryManager.hpp"
#include "audit/TransactionLog.hpp"
#include "cache/Cache.hpp"
#include "cache/Keys.hpp"
#include "db/Store.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "storage/ObjectStore.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <algorithm>
#include <exception>
#include <tuple>
#include <unordered_set>

using namespace fdx::fs;
using namespace fdx::fs::model;
using namespace fdx::audit;
using namespace fdx::audit::model;
using namespace fdx::error;
using namespace fdx::util;

namespace {

std::vector<std::string> ids_of(const std::vector<Entry>& entries) {
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (const auto& e : entries) ids.push_back(e.id);
    return ids;
}

Entry requireEntry(fdx::db::Work& work, const std::string& id) {
    auto entry = work.findEntry(id);
    if (!entry) throw EntryNotFound(id);
    return *entry;
}

void requireUser(fdx::db::Work& work, const std::string& id) {
    if (!work.findUser(id)) throw UserNotFound(id);
}

}

EntryManager::EntryManager(db::Store& store, cache::Cache& cache, storage::ObjectStore& objects,
                           const config::CachingConfig& caching)
    : store_(store), cache_(cache), objects_(objects), caching_(caching) {}

Entry EntryManager::getEntry(const std::string& id) {
    return cache_.cachedRead<Entry>(cache::keys::entry(id), [&] {
        return store_.exec("EntryManager::getEntry", [&](db::Work& work) { return requireEntry(work, id); });
    }, caching_.entry_ttl);
}

std::vector<Entry> EntryManager::listEntries(const std::string& ownerId, const bool includeDeleted,
                                             const std::optional<std::string>& parentId) {
    if (parentId && *parentId != Entry::ROOT_ID) (void) getEntry(*parentId);

    const EntryFilter filter{ownerId, includeDeleted, parentId};
    return cache_.cachedRead<std::vector<Entry>>(cache::keys::entries(filter), [&] {
        return store_.exec("EntryManager::listEntries", [&](db::Work& work) { return work.listEntries(filter); });
    }, caching_.list_ttl);
}

Entry EntryManager::addEntry(const std::string& name, const Entry::Type type, const std::string& authorId,
                             const std::optional<std::string>& parentId) {
    if (name.empty()) throw std::invalid_argument("Entry name must not be empty");

    const auto [entry, txn] = store_.exec("EntryManager::addEntry", [&](db::Work& work) {
        requireUser(work, authorId);
        if (parentId && *parentId != Entry::ROOT_ID) (void) requireEntry(work, *parentId);

        Entry e;
        e.id = generateUUID();
        e.name = name;
        e.type = type;
        e.status = type == Entry::Type::Directory ? Entry::Status::Finalized : Entry::Status::Pending;
        e.author_id = authorId;
        e.parent_id = parentId.value_or(Entry::ROOT_ID);
        e.created_at = e.updated_at = now();

        work.insertEntry(e);
        auto t = TransactionLog::append(work, e.id, authorId, Transaction::Action::Add);
        return std::make_pair(e, std::move(t));
    });

    TransactionLog::publish(txn);
    cache_.writeThrough(cache::keys::entry(entry.id), entry, caching_.entry_ttl);
    cache_.invalidatePrefix(cache::keys::entriesPrefix(entry.author_id));

    log::Registry::fs()->debug("[EntryManager::addEntry] {} '{}' ({}) under {} by {}",
                               to_string(entry.type), entry.name, entry.id, entry.parent_id, authorId);
    return entry;
}

Entry EntryManager::finalize(const std::string& id, const std::optional<std::string>& actorId) {
    // Object I/O happens before the unit of work opens. A missing object is reported only once
    // the entry itself is known to exist.
    std::optional<storage::ObjectStat> stat;
    std::exception_ptr statError;
    try {
        stat = objects_.stat(id);
    } catch (const storage::ObjectNotFound&) {
        statError = std::current_exception();
    }

    const auto [entry, txn] = store_.exec("EntryManager::finalize", [&](db::Work& work) {
        auto e = requireEntry(work, id);
        if (statError) std::rethrow_exception(statError);

        e.size = stat->size;
        e.status = Entry::Status::Finalized;
        e.updated_at = now();

        work.updateEntry(e);
        auto t = TransactionLog::append(work, e.id, actorId.value_or(e.author_id), Transaction::Action::Finalize);
        return std::make_pair(e, std::move(t));
    });

    TransactionLog::publish(txn);

    cache_.writeThrough(cache::keys::entry(entry.id), entry, caching_.entry_ttl);
    cache_.invalidatePrefix(cache::keys::entriesPrefix(entry.author_id));

    log::Registry::fs()->debug("[EntryManager::finalize] {} finalized with {} bytes", id, entry.size);
    return entry;
}

Entry EntryManager::updateEntry(const std::string& id, const EntryUpdate& update, const std::string& actorId) {
    if (update.name && update.name->empty()) throw std::invalid_argument("Entry name must not be empty");

    const auto [entry, txn] = store_.exec("EntryManager::updateEntry", [&](db::Work& work) {
        auto e = requireEntry(work, id);

        if (update.permission && *update.permission != e.permission && !e.isAuthor(actorId)) {
            log::Registry::rbac()->warn("[EntryManager::updateEntry] {} tried to change permission of {} owned by {}",
                                        actorId, id, e.author_id);
            throw NotAuthor("only the author may change the permission of " + id);
        }

        if (update.parent_id && *update.parent_id != e.parent_id) {
            if (*update.parent_id != Entry::ROOT_ID) {
                (void) requireEntry(work, *update.parent_id);
                const auto closure = ids_of(collectClosure(work, e));
                if (std::ranges::find(closure, *update.parent_id) != closure.end())
                    throw CyclicParent(*update.parent_id + " is " + id + " or one of its descendants");
            }
            e.parent_id = *update.parent_id;
        }

        if (update.name) e.name = *update.name;
        if (update.permission) e.permission = *update.permission;
        if (update.permission_inclusive) e.permission_inclusive = *update.permission_inclusive;
        e.updated_at = now();

        work.updateEntry(e);
        auto t = TransactionLog::append(work, e.id, actorId, Transaction::Action::Modify);
        return std::make_pair(e, std::move(t));
    });

    TransactionLog::publish(txn);

    cache_.writeThrough(cache::keys::entry(entry.id), entry, caching_.entry_ttl);
    cache_.invalidatePrefix(cache::keys::entriesPrefix(entry.author_id));
    return entry;
}

Entry EntryManager::removeEntry(const std::string& id, const std::string& actorId) {
    auto [entry, closure, txn] = store_.exec("EntryManager::removeEntry", [&](db::Work& work) {
        auto e = requireEntry(work, id);
        auto members = collectClosure(work, e);

        const auto ts = now();
        work.setDeleted(ids_of(members), ts, ts);
        auto t = TransactionLog::append(work, e.id, actorId, Transaction::Action::Remove);

        e.is_deleted = true;
        e.is_deleted_since = ts;
        e.updated_at = ts;
        return std::make_tuple(e, std::move(members), std::move(t));
    });

    TransactionLog::publish(txn);
    invalidateClosure(closure);

    log::Registry::fs()->debug("[EntryManager::removeEntry] {} marked {} entr{} deleted",
                               actorId, closure.size(), closure.size() == 1 ? "y" : "ies");
    return entry;
}

Entry EntryManager::restoreEntry(const std::string& id, const std::optional<std::string>& actorId) {
    auto [entry, closure, txn] = store_.exec("EntryManager::restoreEntry", [&](db::Work& work) {
        auto e = requireEntry(work, id);
        auto members = collectClosure(work, e);

        if (std::ranges::none_of(members, &Entry::is_deleted))
            return std::make_tuple(e, std::vector<Entry>{}, std::optional<Transaction>{});

        const auto ts = now();
        work.setDeleted(ids_of(members), std::nullopt, ts);
        auto t = TransactionLog::append(work, e.id, actorId.value_or(e.author_id), Transaction::Action::Restore);

        e.is_deleted = false;
        e.is_deleted_since.reset();
        e.updated_at = ts;
        return std::make_tuple(e, std::move(members), std::make_optional(std::move(t)));
    });

    if (txn) {
        TransactionLog::publish(*txn);
        invalidateClosure(closure);
        log::Registry::fs()->debug("[EntryManager::restoreEntry] Restored {} entr{} under {}",
                                   closure.size(), closure.size() == 1 ? "y" : "ies", id);
    }
    return entry;
}

void EntryManager::deleteEntry(const std::string& id, const std::string& actorId, const bool purgeObject) {
    // the delete transaction cascades away with the row, so only the tombstone is published
    const auto [entry, tombstone] = store_.exec("EntryManager::deleteEntry", [&](db::Work& work) {
        const auto e = requireEntry(work, id);
        TransactionLog::append(work, e.id, actorId, Transaction::Action::Delete);
        auto t = TransactionLog::appendTombstone(work, e, actorId, purgeObject);
        work.deleteEntry(e.id);
        return std::make_pair(e, std::move(t));
    });

    TransactionLog::publish(tombstone);

    cache_.invalidate(cache::keys::entry(entry.id));
    cache_.invalidatePrefix(cache::keys::entriesPrefix(entry.author_id));

    if (purgeObject) objects_.remove(entry.id);

    log::Registry::fs()->debug("[EntryManager::deleteEntry] {} deleted {} ('{}'){}",
                               actorId, id, entry.name, purgeObject ? " and purged its object" : "");
}

std::vector<Transaction> EntryManager::listTransactions(const std::string& id) {
    return store_.exec("EntryManager::listTransactions", [&](db::Work& work) {
        (void) requireEntry(work, id);
        return work.listTransactions(id);
    });
}

std::vector<Tombstone> EntryManager::listTombstones(const std::string& entryId) {
    return store_.exec("EntryManager::listTombstones", [&](db::Work& work) { return work.listTombstones(entryId); });
}

std::size_t EntryManager::purgeTrash(const std::time_t cutoff) {
    const auto ids = store_.exec("EntryManager::purgeTrash", [&](db::Work& work) {
        return work.listEntryIdsDeletedBefore(cutoff);
    });

    std::size_t purged = 0;
    for (const auto& id : ids) {
        try {
            const auto entry = store_.exec("EntryManager::purgeTrash", [&](db::Work& work) { return work.findEntry(id); });
            if (!entry || !entry->is_deleted) continue; // restored or already gone

            deleteEntry(id, entry->author_id, !entry->isDirectory());
            ++purged;
        } catch (const std::exception& e) {
            log::Registry::fs()->warn("[EntryManager::purgeTrash] Failed to purge {}: {}", id, e.what());
        }
    }

    if (purged) log::Registry::fs()->info("[EntryManager::purgeTrash] Purged {} of {} expired trash entr{}",
                                          purged, ids.size(), ids.size() == 1 ? "y" : "ies");
    return purged;
}

std::vector<Entry> EntryManager::collectClosure(db::Work& work, const Entry& root) {
    std::vector<Entry> closure{root};
    std::unordered_set<std::string> seen{root.id};
    std::vector<std::string> frontier{root.id};

    while (!frontier.empty()) {
        std::vector<std::string> next;
        for (auto& child : work.listChildren(frontier)) {
            if (!seen.insert(child.id).second) continue;
            next.push_back(child.id);
            closure.push_back(std::move(child));
        }
        frontier = std::move(next);
    }

    return closure;
}

void EntryManager::invalidateClosure(const std::vector<Entry>& closure) {
    std::unordered_set<std::string> authors;
    for (const auto& e : closure) {
        cache_.invalidate(cache::keys::entry(e.id));
        authors.insert(e.author_id);
    }
    for (const auto& author : authors) cache_.invalidatePrefix(cache::keys::entriesPrefix(author));
}
