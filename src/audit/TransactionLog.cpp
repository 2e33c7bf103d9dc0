#include "audit/TransactionLog.hpp"
#include "db/Store.hpp"
#include "fs/model/Entry.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

using namespace fdx::audit;
using namespace fdx::audit::model;
using namespace fdx::util;

Transaction TransactionLog::append(db::Work& work, const std::string& entryId, const std::string& actorId,
                                   const Transaction::Action action) {
    Transaction txn;
    txn.id = generateUUID();
    txn.entry_id = entryId;
    txn.actor_id = actorId;
    txn.action = action;
    txn.created_at = now();

    work.insertTransaction(txn);
    return txn;
}

Tombstone TransactionLog::appendTombstone(db::Work& work, const fs::model::Entry& entry, const std::string& actorId,
                                          const bool purgedObject) {
    Tombstone t;
    t.id = generateUUID();
    t.entry_id = entry.id;
    t.entry_name = entry.name;
    t.author_id = entry.author_id;
    t.actor_id = actorId;
    t.purged_object = purgedObject;
    t.created_at = now();

    work.insertTombstone(t);
    return t;
}

void TransactionLog::publish(const Transaction& txn) {
    log::Registry::audit()->info("{} entry={} actor={} txn={}", to_string(txn.action), txn.entry_id, txn.actor_id,
                                 txn.id);
}

void TransactionLog::publish(const Tombstone& t) {
    log::Registry::audit()->info("delete entry={} name='{}' author={} actor={} purge={} tombstone={}",
                                 t.entry_id, t.entry_name, t.author_id, t.actor_id, t.purged_object, t.id);
}
