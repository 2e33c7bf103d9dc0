#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace fdx::audit::model {

// What remains of a hard-deleted entry. Not tied to the entries table by a
// foreign key, so it outlives the row it describes.
struct Tombstone {
    std::string id{}, entry_id{}, entry_name{}, author_id{}, actor_id{};
    bool purged_object{false};
    std::time_t created_at{};

    Tombstone() = default;
    explicit Tombstone(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const Tombstone& t);

std::vector<Tombstone> tombstones_from_pq_res(const pqxx::result& res);

}
