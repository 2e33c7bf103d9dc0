#include "rbac/Evaluator.hpp"
#include "fs/model/Entry.hpp"

using namespace fdx::rbac;

bool Evaluator::canView(const fs::model::Entry& entry, const std::string& userId) {
    switch (entry.permission) {
        case EntryPermission::Public:
        case EntryPermission::PublicReadonly: return true;
        case EntryPermission::Inclusive:
        case EntryPermission::InclusiveReadonly: return entry.isMember(userId);
        case EntryPermission::Private:
        case EntryPermission::Other: return false;
    }
    return false;
}

bool Evaluator::canModify(const fs::model::Entry& entry, const std::string& userId) {
    switch (entry.permission) {
        case EntryPermission::Public:
        case EntryPermission::Inclusive: return entry.isMember(userId);
        case EntryPermission::PublicReadonly:
        case EntryPermission::InclusiveReadonly:
        case EntryPermission::Private:
        case EntryPermission::Other: return false;
    }
    return false;
}
