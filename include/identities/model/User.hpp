#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace fdx::identities::model {

struct User {
    std::string id{}, username{}, display_name{};
    std::string password_hash{}; // never serialized
    std::time_t created_at{}, updated_at{};

    User() = default;
    explicit User(const pqxx::row& row);
};

struct UserUpdate {
    std::optional<std::string> username{}, display_name{}, password{};
};

void to_json(nlohmann::json& j, const User& user);
void from_json(const nlohmann::json& j, User& user);

std::vector<User> users_from_pq_res(const pqxx::result& res);

}
