#include "rbac/Guard.hpp"
#include "rbac/Evaluator.hpp"
#include "auth/AuthManager.hpp"
#include "error/Error.hpp"
#include "fs/EntryManager.hpp"
#include "log/Registry.hpp"

using namespace fdx::rbac;
using namespace fdx::fs::model;
using namespace fdx::error;

Guard::Guard(fs::EntryManager& entries, auth::AuthManager& users) : entries_(entries), users_(users) {}

Entry Guard::requireView(const std::string& entryId, const std::string& userId) const {
    (void) users_.getUser(userId);
    auto entry = entries_.getEntry(entryId);
    if (entry.isAuthor(userId) || Evaluator::canView(entry, userId)) return entry;

    log::Registry::rbac()->warn("[Guard::requireView] {} denied view of {} ({})", userId, entryId,
                                to_string(entry.permission));
    throw PermissionDenied(userId + " may not view " + entryId);
}

Entry Guard::requireModify(const std::string& entryId, const std::string& userId) const {
    (void) users_.getUser(userId);
    auto entry = entries_.getEntry(entryId);
    if (entry.isAuthor(userId) || Evaluator::canModify(entry, userId)) return entry;

    log::Registry::rbac()->warn("[Guard::requireModify] {} denied modify of {} ({})", userId, entryId,
                                to_string(entry.permission));
    throw PermissionDenied(userId + " may not modify " + entryId);
}

Entry Guard::requireAuthor(const std::string& entryId, const std::string& userId) const {
    (void) users_.getUser(userId);
    auto entry = entries_.getEntry(entryId);
    if (entry.isAuthor(userId)) return entry;

    log::Registry::rbac()->warn("[Guard::requireAuthor] {} is not the author of {}", userId, entryId);
    throw NotAuthor(userId + " is not the author of " + entryId);
}
