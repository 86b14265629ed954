#include "stores.hpp"
#include "util.hpp"

nlohmann::json WindowEntry::to_json() const {
    nlohmann::json j;
    j["transaction_id"] = transaction_id;
    j["amount"] = amount;
    j["timestamp"] = util::format_iso8601(timestamp);
    return j;
}

WindowEntry WindowEntry::from_json(const nlohmann::json& j) {
    WindowEntry entry;
    entry.transaction_id = j.at("transaction_id").get<std::string>();
    entry.amount = j.at("amount").get<double>();
    entry.timestamp = util::parse_iso8601(j.at("timestamp").get<std::string>());
    return entry;
}
