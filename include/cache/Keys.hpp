#pragma once

#include "fs/model/Entry.hpp"

#include <string>

// Cache key layout. List keys share the "entries:<owner>:" prefix so all filter variants
// cached for one owner can be dropped together.
namespace fdx::cache::keys {

inline std::string entry(const std::string& id) { return "entry:" + id; }

inline std::string entriesPrefix(const std::string& ownerId) { return "entries:" + ownerId + ":"; }

inline std::string entries(const fs::model::EntryFilter& filter) {
    return entriesPrefix(filter.author_id) + (filter.include_deleted ? "all" : "live") + ":" +
           (filter.parent_id ? *filter.parent_id : "*");
}

inline std::string user(const std::string& id) { return "user:" + id; }

inline std::string session(const std::string& id) { return "session:" + id; }

}
