#include "rbac/Permission.hpp"

#include <stdexcept>

namespace fdx::rbac {

std::string to_string(const EntryPermission permission) {
    switch (permission) {
        case EntryPermission::Private: return "private";
        case EntryPermission::Public: return "public";
        case EntryPermission::PublicReadonly: return "public_readonly";
        case EntryPermission::Inclusive: return "inclusive";
        case EntryPermission::InclusiveReadonly: return "inclusive_readonly";
        case EntryPermission::Other: return "other";
    }
    throw std::invalid_argument("Unknown entry permission");
}

EntryPermission entryPermissionFromString(const std::string& str) {
    if (str == "private") return EntryPermission::Private;
    if (str == "public") return EntryPermission::Public;
    if (str == "public_readonly") return EntryPermission::PublicReadonly;
    if (str == "inclusive") return EntryPermission::Inclusive;
    if (str == "inclusive_readonly") return EntryPermission::InclusiveReadonly;
    if (str == "other") return EntryPermission::Other;
    throw std::invalid_argument("Unknown entry permission: " + str);
}

}
