#pragma once

#include "db/Store.hpp"

#include <map>
#include <mutex>

namespace fdx::db {

// In-process backend. A unit of work runs on a private copy of all tables which replaces the
// live copy only when the work returns, so a throw leaves nothing behind. Enforces the same
// foreign keys, cascades and unique constraints as the PostgreSQL schema.
class MemoryStore final : public Store {
public:
    struct Tables {
        std::map<std::string, fs::model::Entry> entries;
        std::vector<audit::model::Transaction> transactions;
        std::vector<audit::model::Tombstone> tombstones;
        std::map<std::string, identities::model::User> users;
        std::map<std::string, auth::model::Session> sessions;
    };

    MemoryStore() = default;

    // Test hook: a consistent copy of the committed state.
    [[nodiscard]] Tables snapshot() const;

protected:
    void run(const std::string& ctx, const std::function<void(Work&)>& fn) override;

private:
    mutable std::mutex mutex_;
    Tables tables_;
};

}
