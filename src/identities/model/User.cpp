#include "identities/model/User.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>

using namespace fdx::identities::model;
using namespace fdx::util;

User::User(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      username(row["username"].as<std::string>()),
      display_name(row["display_name"].as<std::string>()),
      password_hash(row["password_hash"].as<std::string>()),
      created_at(parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(parsePostgresTimestamp(row["updated_at"].as<std::string>())) {}

void fdx::identities::model::to_json(nlohmann::json& j, const User& user) {
    j = {
        {"id", user.id},
        {"username", user.username},
        {"display_name", user.display_name},
        {"created_at", timestampToString(user.created_at)},
        {"updated_at", timestampToString(user.updated_at)}
    };
}

void fdx::identities::model::from_json(const nlohmann::json& j, User& user) {
    user.id = j.at("id").get<std::string>();
    user.username = j.at("username").get<std::string>();
    user.display_name = j.at("display_name").get<std::string>();
    user.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
    user.updated_at = parseTimestampFromString(j.at("updated_at").get<std::string>());
    user.password_hash.clear();
}

std::vector<User> fdx::identities::model::users_from_pq_res(const pqxx::result& res) {
    std::vector<User> users;
    users.reserve(res.size());
    for (const auto& row : res) users.emplace_back(row);
    return users;
}
