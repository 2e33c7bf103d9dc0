#pragma once

#include <string>

namespace fdx::rbac {

// Access mode stored on every entry. Inclusive modes consult the entry's member list.
enum class EntryPermission {
    Private,
    Public,
    PublicReadonly,
    Inclusive,
    InclusiveReadonly,
    Other
};

std::string to_string(EntryPermission permission);
EntryPermission entryPermissionFromString(const std::string& str);

}
