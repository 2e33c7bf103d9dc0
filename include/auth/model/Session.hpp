#pragma once

#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace fdx::auth::model {

struct Session {
    std::string id{}, user_id{};
    std::time_t valid_until{}, created_at{};

    Session() = default;
    explicit Session(const pqxx::row& row);

    [[nodiscard]] bool isExpired(std::time_t now) const { return valid_until <= now; }
};

void to_json(nlohmann::json& j, const Session& s);
void from_json(const nlohmann::json& j, Session& s);

}
