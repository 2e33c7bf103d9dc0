#include "auth/model/Session.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>

using namespace fdx::auth::model;
using namespace fdx::util;

Session::Session(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      user_id(row["user_id"].as<std::string>()),
      valid_until(parsePostgresTimestamp(row["valid_until"].as<std::string>())),
      created_at(parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

void fdx::auth::model::to_json(nlohmann::json& j, const Session& s) {
    j = {
        {"id", s.id},
        {"user_id", s.user_id},
        {"valid_until", timestampToString(s.valid_until)},
        {"created_at", timestampToString(s.created_at)}
    };
}

void fdx::auth::model::from_json(const nlohmann::json& j, Session& s) {
    s.id = j.at("id").get<std::string>();
    s.user_id = j.at("user_id").get<std::string>();
    s.valid_until = parseTimestampFromString(j.at("valid_until").get<std::string>());
    s.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
}
