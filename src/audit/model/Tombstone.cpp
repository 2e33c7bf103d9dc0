#include "audit/model/Tombstone.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>

using namespace fdx::audit::model;
using namespace fdx::util;

Tombstone::Tombstone(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      entry_id(row["entry_id"].as<std::string>()),
      entry_name(row["entry_name"].as<std::string>()),
      author_id(row["author_id"].as<std::string>()),
      actor_id(row["actor_id"].as<std::string>()),
      purged_object(row["purged_object"].as<bool>()),
      created_at(parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

void fdx::audit::model::to_json(nlohmann::json& j, const Tombstone& t) {
    j = {
        {"id", t.id},
        {"entry_id", t.entry_id},
        {"entry_name", t.entry_name},
        {"author_id", t.author_id},
        {"actor_id", t.actor_id},
        {"purged_object", t.purged_object},
        {"created_at", timestampToString(t.created_at)}
    };
}

std::vector<Tombstone> fdx::audit::model::tombstones_from_pq_res(const pqxx::result& res) {
    std::vector<Tombstone> out;
    out.reserve(res.size());
    for (const auto& row : res) out.emplace_back(row);
    return out;
}
