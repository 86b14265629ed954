#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<RiskProfile> find_by_customer_id(const std::string& customer_id) = 0;

    // version 0 inserts, anything else updates only if the stored version still
    // matches. Returns the profile as stored (version bumped). Throws
    // ConcurrencyConflictError on a stale version.
    virtual RiskProfile save(const RiskProfile& profile) = 0;
};

class FactorStore {
public:
    virtual ~FactorStore() = default;

    // Factors from the most recent assessment of the profile
    virtual std::vector<RiskFactor> find_by_profile(const std::string& profile_id) = 0;

    // Supersedes the profile's previous factor set
    virtual void save(const std::string& profile_id, const std::vector<RiskFactor>& factors) = 0;
};

class ScoreStore {
public:
    virtual ~ScoreStore() = default;
    virtual void save(const RiskScore& score) = 0;
};

class AlertStore {
public:
    virtual ~AlertStore() = default;
    virtual void save(const FraudAlert& alert) = 0;
};

// Unit of work. Writes made through the stores become visible on commit();
// destroying an uncommitted session rolls every write back.
class StoreSession {
public:
    virtual ~StoreSession() = default;

    virtual ProfileStore& profiles() = 0;
    virtual FactorStore& factors() = 0;
    virtual ScoreStore& scores() = 0;
    virtual AlertStore& alerts() = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

class RiskRepository {
public:
    virtual ~RiskRepository() = default;

    virtual std::unique_ptr<StoreSession> open_session() = 0;
    virtual bool is_healthy() = 0;
};

// Rolling per-customer transaction window used for velocity checks
struct WindowEntry {
    std::string transaction_id;
    double amount = 0.0;
    TimePoint timestamp;

    nlohmann::json to_json() const;
    static WindowEntry from_json(const nlohmann::json& j);
};

class TransactionWindowStore {
public:
    virtual ~TransactionWindowStore() = default;

    // Up to max_entries most recent entries, oldest first
    virtual std::vector<WindowEntry> load(const std::string& customer_id, int max_entries) = 0;

    // No-op when the transaction id is already in the window
    virtual void append(const std::string& customer_id, const WindowEntry& entry, int max_entries) = 0;
};
