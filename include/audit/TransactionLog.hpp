#pragma once

#include "audit/model/Transaction.hpp"
#include "audit/model/Tombstone.hpp"

#include <string>

namespace fdx::db { class Work; }
namespace fdx::fs::model { struct Entry; }

namespace fdx::audit {

// Append-only audit writer. append* stages a record on the caller's unit of work so it commits
// or rolls back with the mutation it describes. publish writes the audit.log line and is called
// only once that unit has committed.
class TransactionLog {
public:
    static model::Transaction append(db::Work& work, const std::string& entryId, const std::string& actorId,
                                     model::Transaction::Action action);

    // A hard delete takes the entry's transactions with it; the deletion is recorded here instead.
    static model::Tombstone appendTombstone(db::Work& work, const fs::model::Entry& entry, const std::string& actorId,
                                            bool purgedObject);

    static void publish(const model::Transaction& txn);
    static void publish(const model::Tombstone& tombstone);
};

}
