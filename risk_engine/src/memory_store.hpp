#pragma once

#include "stores.hpp"
#include <deque>
#include <map>
#include <mutex>

// In-process repository. Sessions stage their writes and apply them under one
// lock on commit, with the same optimistic version rules as the database.
class MemoryRiskRepository : public RiskRepository {
public:
    std::unique_ptr<StoreSession> open_session() override;
    bool is_healthy() override { return true; }

    // Committed state, for inspection
    std::optional<RiskProfile> profile(const std::string& customer_id) const;
    std::vector<RiskFactor> factors(const std::string& profile_id) const;
    std::vector<RiskScore> scores(const std::string& profile_id) const;
    std::vector<FraudAlert> alerts() const;
    size_t profile_count() const;

private:
    friend class MemoryStoreSession;

    mutable std::mutex mutex_;
    std::map<std::string, RiskProfile> profiles_;                // by customer id
    std::map<std::string, std::vector<RiskFactor>> factors_;     // by profile id
    std::vector<RiskScore> scores_;
    std::vector<FraudAlert> alerts_;
};

class MemoryWindowStore : public TransactionWindowStore {
public:
    std::vector<WindowEntry> load(const std::string& customer_id, int max_entries) override;
    void append(const std::string& customer_id, const WindowEntry& entry, int max_entries) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::deque<WindowEntry>> windows_;
};
