#include "fs/model/Entry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>
#include <stdexcept>

using namespace fdx::fs::model;
using namespace fdx::util;

Entry::Entry(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      name(row["name"].as<std::string>()),
      author_id(row["author_id"].as<std::string>()),
      parent_id(row["parent_id"].as<std::string>()),
      size(row["size"].as<uintmax_t>()),
      type(entryTypeFromString(row["type"].as<std::string>())),
      status(entryStatusFromString(row["status"].as<std::string>())),
      is_deleted(row["is_deleted"].as<bool>()),
      permission(rbac::entryPermissionFromString(row["permission"].as<std::string>())),
      created_at(parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(parsePostgresTimestamp(row["updated_at"].as<std::string>())) {
    if (row["is_deleted_since"].is_null()) is_deleted_since = std::nullopt;
    else is_deleted_since = parsePostgresTimestamp(row["is_deleted_since"].as<std::string>());

    if (!row["permission_inclusive"].is_null())
        permission_inclusive = nlohmann::json::parse(row["permission_inclusive"].c_str()).get<std::vector<std::string>>();
}

bool Entry::isMember(const std::string& userId) const {
    return std::ranges::find(permission_inclusive, userId) != permission_inclusive.end();
}

std::string fdx::fs::model::to_string(const Entry::Type type) {
    switch (type) {
        case Entry::Type::File: return "file";
        case Entry::Type::Directory: return "directory";
        case Entry::Type::Other: return "other";
    }
    throw std::invalid_argument("Unknown entry type");
}

Entry::Type fdx::fs::model::entryTypeFromString(const std::string& str) {
    if (str == "file") return Entry::Type::File;
    if (str == "directory") return Entry::Type::Directory;
    if (str == "other") return Entry::Type::Other;
    throw std::invalid_argument("Unknown entry type: " + str);
}

std::string fdx::fs::model::to_string(const Entry::Status status) {
    switch (status) {
        case Entry::Status::Pending: return "pending";
        case Entry::Status::Finalized: return "finalized";
    }
    throw std::invalid_argument("Unknown entry status");
}

Entry::Status fdx::fs::model::entryStatusFromString(const std::string& str) {
    if (str == "pending") return Entry::Status::Pending;
    if (str == "finalized") return Entry::Status::Finalized;
    throw std::invalid_argument("Unknown entry status: " + str);
}

void fdx::fs::model::to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"id", entry.id},
        {"name", entry.name},
        {"size", entry.size},
        {"type", to_string(entry.type)},
        {"status", to_string(entry.status)},
        {"author_id", entry.author_id},
        {"parent_id", entry.parent_id},
        {"is_deleted", entry.is_deleted},
        {"permission", rbac::to_string(entry.permission)},
        {"permission_inclusive", entry.permission_inclusive},
        {"created_at", timestampToString(entry.created_at)},
        {"updated_at", timestampToString(entry.updated_at)},
    };

    if (entry.is_deleted_since) j["is_deleted_since"] = timestampToString(*entry.is_deleted_since);
    else j["is_deleted_since"] = nullptr;
}

void fdx::fs::model::from_json(const nlohmann::json& j, Entry& entry) {
    entry.id = j.at("id").get<std::string>();
    entry.name = j.at("name").get<std::string>();
    entry.size = j.at("size").get<uintmax_t>();
    entry.type = entryTypeFromString(j.at("type").get<std::string>());
    entry.status = entryStatusFromString(j.at("status").get<std::string>());
    entry.author_id = j.at("author_id").get<std::string>();
    entry.parent_id = j.at("parent_id").get<std::string>();
    entry.is_deleted = j.at("is_deleted").get<bool>();
    entry.permission = rbac::entryPermissionFromString(j.at("permission").get<std::string>());
    entry.permission_inclusive = j.at("permission_inclusive").get<std::vector<std::string>>();
    entry.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
    entry.updated_at = parseTimestampFromString(j.at("updated_at").get<std::string>());

    if (j.contains("is_deleted_since") && !j["is_deleted_since"].is_null())
        entry.is_deleted_since = parseTimestampFromString(j.at("is_deleted_since").get<std::string>());
    else entry.is_deleted_since.reset();
}

std::vector<Entry> fdx::fs::model::entries_from_pq_res(const pqxx::result& res) {
    std::vector<Entry> entries;
    entries.reserve(res.size());
    for (const auto& row : res) entries.emplace_back(row);
    return entries;
}
