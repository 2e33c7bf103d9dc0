#pragma once

#include <string>

namespace fdx::fs::model { struct Entry; }

namespace fdx::rbac {

// The view/modify table keyed by entry permission. Authorship is not consulted here.
//
//   permission          view        modify
//   private             no          no
//   public              yes         member
//   public_readonly     yes         no
//   inclusive           member      member
//   inclusive_readonly  member      no
//   other               no          no
class Evaluator {
public:
    [[nodiscard]] static bool canView(const fs::model::Entry& entry, const std::string& userId);
    [[nodiscard]] static bool canModify(const fs::model::Entry& entry, const std::string& userId);
};

}
