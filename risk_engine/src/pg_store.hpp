#pragma once

#include "config.hpp"
#include "stores.hpp"
#include <memory>

// libpqxx-backed repository. Each session leases a pooled connection and runs
// one pqxx::work; profile updates are guarded by the version column.
class PostgresRiskRepository : public RiskRepository {
public:
    explicit PostgresRiskRepository(const Config& config);
    ~PostgresRiskRepository() override;

    std::unique_ptr<StoreSession> open_session() override;
    bool is_healthy() override;

    // Creates the tables if they do not exist yet
    void ensure_schema();

    // Non-copyable
    PostgresRiskRepository(const PostgresRiskRepository&) = delete;
    PostgresRiskRepository& operator=(const PostgresRiskRepository&) = delete;

private:
    friend class PgStoreSession;

    class Impl;
    std::unique_ptr<Impl> impl_;
};
