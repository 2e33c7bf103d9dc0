#pragma once

#include "fs/model/Entry.hpp"

#include <string>

namespace fdx::fs { class EntryManager; }
namespace fdx::auth { class AuthManager; }

namespace fdx::rbac {

// Caller-side checks in front of entry operations. The author always passes; everyone
// else goes through Evaluator. Entry and user are resolved through the cached read path.
class Guard {
public:
    Guard(fs::EntryManager& entries, auth::AuthManager& users);

    // Each resolves the user first (UserNotFound), then the entry (EntryNotFound), and returns
    // the entry or throws PermissionDenied / NotAuthor.
    fs::model::Entry requireView(const std::string& entryId, const std::string& userId) const;
    fs::model::Entry requireModify(const std::string& entryId, const std::string& userId) const;
    fs::model::Entry requireAuthor(const std::string& entryId, const std::string& userId) const;

private:
    fs::EntryManager& entries_;
    auth::AuthManager& users_;
};

}
