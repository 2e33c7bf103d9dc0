#include "audit/model/Transaction.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>
#include <stdexcept>

using namespace fdx::audit::model;
using namespace fdx::util;

Transaction::Transaction(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      entry_id(row["entry_id"].as<std::string>()),
      actor_id(row["actor_id"].as<std::string>()),
      action(transactionActionFromString(row["action"].as<std::string>())),
      created_at(parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

std::string fdx::audit::model::to_string(const Transaction::Action action) {
    switch (action) {
        case Transaction::Action::Add: return "add";
        case Transaction::Action::Finalize: return "finalize";
        case Transaction::Action::Remove: return "remove";
        case Transaction::Action::Restore: return "restore";
        case Transaction::Action::Delete: return "delete";
        case Transaction::Action::Modify: return "modify";
        case Transaction::Action::Other: return "other";
    }
    throw std::invalid_argument("Unknown transaction action");
}

Transaction::Action fdx::audit::model::transactionActionFromString(const std::string& str) {
    if (str == "add") return Transaction::Action::Add;
    if (str == "finalize") return Transaction::Action::Finalize;
    if (str == "remove") return Transaction::Action::Remove;
    if (str == "restore") return Transaction::Action::Restore;
    if (str == "delete") return Transaction::Action::Delete;
    if (str == "modify") return Transaction::Action::Modify;
    if (str == "other") return Transaction::Action::Other;
    throw std::invalid_argument("Unknown transaction action: " + str);
}

void fdx::audit::model::to_json(nlohmann::json& j, const Transaction& txn) {
    j = {
        {"id", txn.id},
        {"entry_id", txn.entry_id},
        {"actor_id", txn.actor_id},
        {"action", to_string(txn.action)},
        {"created_at", timestampToString(txn.created_at)}
    };
}

void fdx::audit::model::from_json(const nlohmann::json& j, Transaction& txn) {
    txn.id = j.at("id").get<std::string>();
    txn.entry_id = j.at("entry_id").get<std::string>();
    txn.actor_id = j.at("actor_id").get<std::string>();
    txn.action = transactionActionFromString(j.at("action").get<std::string>());
    txn.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
}

std::vector<Transaction> fdx::audit::model::transactions_from_pq_res(const pqxx::result& res) {
    std::vector<Transaction> txns;
    txns.reserve(res.size());
    for (const auto& row : res) txns.emplace_back(row);
    return txns;
}
