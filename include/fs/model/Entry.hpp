#pragma once

#include "rbac/Permission.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace fdx::fs::model {

struct Entry {
    enum class Type { File, Directory, Other };
    enum class Status { Pending, Finalized };

    // parent_id of top-level entries; never a real row
    static constexpr const auto* ROOT_ID = "root";

    std::string id{}, name{}, author_id{}, parent_id{ROOT_ID};
    uintmax_t size{0};
    Type type{Type::File};
    Status status{Status::Pending};
    bool is_deleted{false};
    std::optional<std::time_t> is_deleted_since{};
    rbac::EntryPermission permission{rbac::EntryPermission::Private};
    std::vector<std::string> permission_inclusive{};
    std::time_t created_at{}, updated_at{};

    Entry() = default;
    explicit Entry(const pqxx::row& row);

    [[nodiscard]] bool operator==(const Entry& other) const = default;

    [[nodiscard]] bool isDirectory() const { return type == Type::Directory; }
    [[nodiscard]] bool isFinalized() const { return status == Status::Finalized; }
    [[nodiscard]] bool isTopLevel() const { return parent_id == ROOT_ID; }
    [[nodiscard]] bool isAuthor(const std::string& userId) const { return author_id == userId; }
    [[nodiscard]] bool isMember(const std::string& userId) const;
};

// Filter of listEntries; also the parameter set of the list cache key.
struct EntryFilter {
    std::string author_id{};
    bool include_deleted{false};
    std::optional<std::string> parent_id{};
};

std::string to_string(Entry::Type type);
Entry::Type entryTypeFromString(const std::string& str);

std::string to_string(Entry::Status status);
Entry::Status entryStatusFromString(const std::string& str);

void to_json(nlohmann::json& j, const Entry& entry);
void from_json(const nlohmann::json& j, Entry& entry);

std::vector<Entry> entries_from_pq_res(const pqxx::result& res);

}
