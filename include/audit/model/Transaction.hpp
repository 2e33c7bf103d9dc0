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

struct Transaction {
    enum class Action { Add, Finalize, Remove, Restore, Delete, Modify, Other };

    std::string id{}, entry_id{}, actor_id{};
    Action action{Action::Other};
    std::time_t created_at{};

    Transaction() = default;
    explicit Transaction(const pqxx::row& row);

    [[nodiscard]] bool operator==(const Transaction& other) const = default;
};

std::string to_string(Transaction::Action action);
Transaction::Action transactionActionFromString(const std::string& str);

void to_json(nlohmann::json& j, const Transaction& txn);
void from_json(const nlohmann::json& j, Transaction& txn);

std::vector<Transaction> transactions_from_pq_res(const pqxx::result& res);

}
