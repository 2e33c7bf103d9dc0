#pragma once

#include "fs/model/Entry.hpp"
#include "audit/model/Transaction.hpp"
#include "audit/model/Tombstone.hpp"
#include "config/Config.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace fdx::db {
class Store;
class Work;
}

namespace fdx::cache { class Cache; }
namespace fdx::storage { class ObjectStore; }

namespace fdx::fs {

// Fields left empty are not touched by updateEntry.
struct EntryUpdate {
    std::optional<std::string> name{};
    std::optional<std::string> parent_id{};
    std::optional<rbac::EntryPermission> permission{};
    std::optional<std::vector<std::string>> permission_inclusive{};
};

// Entry tree engine. Every mutation is one unit of work on the store (row changes plus the
// audit record); cache keys are invalidated after it commits.
class EntryManager {
public:
    EntryManager(db::Store& store, cache::Cache& cache, storage::ObjectStore& objects,
                 const config::CachingConfig& caching);

    [[nodiscard]] model::Entry getEntry(const std::string& id);

    // Finalized entries authored by ownerId. A parentId other than the root sentinel must resolve.
    [[nodiscard]] std::vector<model::Entry> listEntries(const std::string& ownerId, bool includeDeleted = false,
                                                        const std::optional<std::string>& parentId = std::nullopt);

    model::Entry addEntry(const std::string& name, model::Entry::Type type, const std::string& authorId,
                          const std::optional<std::string>& parentId = std::nullopt);

    // Upload of the backing object completed: record its size and mark the entry finalized.
    model::Entry finalize(const std::string& id, const std::optional<std::string>& actorId = std::nullopt);

    model::Entry updateEntry(const std::string& id, const EntryUpdate& update, const std::string& actorId);

    // Soft delete of the entry and all of its descendants.
    model::Entry removeEntry(const std::string& id, const std::string& actorId);

    // Clears the soft delete across the same closure. No-op when nothing in it is deleted.
    model::Entry restoreEntry(const std::string& id, const std::optional<std::string>& actorId = std::nullopt);

    // Removes the single row; descendants are left in place.
    void deleteEntry(const std::string& id, const std::string& actorId, bool purgeObject = false);

    [[nodiscard]] std::vector<audit::model::Transaction> listTransactions(const std::string& id);
    [[nodiscard]] std::vector<audit::model::Tombstone> listTombstones(const std::string& entryId);

    // Hard deletes, with object purge, every entry soft-deleted before cutoff. Returns the count.
    std::size_t purgeTrash(std::time_t cutoff);

    // The entry plus every transitive descendant, target first. Never visits an id twice.
    static std::vector<model::Entry> collectClosure(db::Work& work, const model::Entry& root);

private:
    db::Store& store_;
    cache::Cache& cache_;
    storage::ObjectStore& objects_;
    config::CachingConfig caching_;

    void invalidateClosure(const std::vector<model::Entry>& closure);
};

}
