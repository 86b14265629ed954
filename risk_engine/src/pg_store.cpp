#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace {
    const char* kSchema = R"(
        CREATE TABLE IF NOT EXISTS risk_profiles (
            id TEXT PRIMARY KEY,
            customer_id TEXT NOT NULL UNIQUE,
            current_score INTEGER NOT NULL,
            category TEXT NOT NULL,
            last_assessed_at TIMESTAMPTZ,
            created_at TIMESTAMPTZ NOT NULL,
            version BIGINT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS risk_scores (
            id TEXT PRIMARY KEY,
            assessment_id TEXT NOT NULL,
            profile_id TEXT NOT NULL REFERENCES risk_profiles(id),
            score INTEGER NOT NULL,
            category TEXT NOT NULL,
            confidence INTEGER NOT NULL,
            assessment_date TIMESTAMPTZ NOT NULL
        );

        CREATE TABLE IF NOT EXISTS risk_factors (
            profile_id TEXT NOT NULL REFERENCES risk_profiles(id),
            name TEXT NOT NULL,
            score DOUBLE PRECISION NOT NULL,
            weight DOUBLE PRECISION NOT NULL,
            description TEXT NOT NULL,
            data_source TEXT NOT NULL,
            calculated_at TIMESTAMPTZ NOT NULL
        );

        CREATE TABLE IF NOT EXISTS fraud_alerts (
            id TEXT PRIMARY KEY,
            transaction_id TEXT NOT NULL,
            customer_id TEXT NOT NULL,
            reason TEXT NOT NULL,
            risk_score_ref INTEGER NOT NULL,
            status TEXT NOT NULL,
            created_at TIMESTAMPTZ NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_risk_scores_profile ON risk_scores(profile_id);
        CREATE INDEX IF NOT EXISTS idx_risk_factors_profile ON risk_factors(profile_id);
        CREATE INDEX IF NOT EXISTS idx_fraud_alerts_customer ON fraud_alerts(customer_id);
    )";

    // Timestamps leave the database in the same ISO-8601 form util::parse_iso8601 reads
    std::string iso_column(const std::string& column) {
        return "to_char(" + column + " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')";
    }

    RiskProfile profile_from_row(const pqxx::row& row) {
        RiskProfile profile;
        profile.id = row["id"].as<std::string>();
        profile.customer_id = row["customer_id"].as<std::string>();
        profile.current_score = row["current_score"].as<int>();
        profile.category = risk_category_from_string(row["category"].as<std::string>());
        if (!row["last_assessed_at"].is_null()) {
            profile.last_assessed_at = util::parse_iso8601(row["last_assessed_at"].as<std::string>());
        }
        profile.created_at = util::parse_iso8601(row["created_at"].as<std::string>());
        profile.version = row["version"].as<long>();
        return profile;
    }
}

class PostgresRiskRepository::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    std::unique_ptr<pqxx::connection> lease() {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        bool available = pool_cv_.wait_for(lock, std::chrono::seconds(5), [this] {
            return !idle_.empty() || open_count_ < config_.pg_pool_size;
        });
        if (!available) {
            throw PersistenceError("no database connection available");
        }

        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            if (conn->is_open()) {
                return conn;
            }
            open_count_--;
            spdlog::warn("Discarding closed PostgreSQL connection");
        }

        open_count_++;
        lock.unlock();
        try {
            auto conn = std::make_unique<pqxx::connection>(config_.pg_dsn);
            spdlog::debug("Opened PostgreSQL connection (pool size {})", config_.pg_pool_size);
            return conn;
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> relock(pool_mutex_);
                open_count_--;
            }
            pool_cv_.notify_one();
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            throw PersistenceError(std::string("connection failed: ") + e.what());
        }
    }

    void release(std::unique_ptr<pqxx::connection> conn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (conn && conn->is_open()) {
                idle_.push_back(std::move(conn));
            } else {
                open_count_--;
            }
        }
        pool_cv_.notify_one();
    }

    const Config& config_;

private:
    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    int open_count_ = 0;
};

class PgStoreSession : public StoreSession {
public:
    PgStoreSession(PostgresRiskRepository::Impl& pool, std::unique_ptr<pqxx::connection> conn)
        : pool_(pool), conn_(std::move(conn)),
          profiles_(*this), factors_(*this), scores_(*this), alerts_(*this) {
        try {
            txn_ = std::make_unique<pqxx::work>(*conn_);
        } catch (const std::exception& e) {
            pool_.release(std::move(conn_));
            throw PersistenceError(std::string("failed to begin transaction: ") + e.what());
        }
    }

    ~PgStoreSession() override {
        if (txn_) {
            rollback();
        }
        pool_.release(std::move(conn_));
    }

    ProfileStore& profiles() override { return profiles_; }
    FactorStore& factors() override { return factors_; }
    ScoreStore& scores() override { return scores_; }
    AlertStore& alerts() override { return alerts_; }

    void commit() override {
        pqxx::work& txn = work();
        try {
            txn.commit();
            txn_.reset();
        } catch (const std::exception& e) {
            txn_.reset();
            throw PersistenceError(std::string("commit failed: ") + e.what());
        }
    }

    void rollback() override {
        if (!txn_) {
            return;
        }
        try {
            txn_->abort();
        } catch (const std::exception& e) {
            spdlog::warn("PostgreSQL rollback failed: {}", e.what());
        }
        txn_.reset();
    }

private:
    pqxx::work& work() {
        if (!txn_) {
            throw PersistenceError("session already finished");
        }
        return *txn_;
    }

    class Profiles : public ProfileStore {
    public:
        explicit Profiles(PgStoreSession& s) : s_(s) {}

        std::optional<RiskProfile> find_by_customer_id(const std::string& customer_id) override {
            try {
                pqxx::result result = s_.work().exec_params(
                    "SELECT id, customer_id, current_score, category, " +
                    iso_column("last_assessed_at") + " AS last_assessed_at, " +
                    iso_column("created_at") + " AS created_at, version "
                    "FROM risk_profiles WHERE customer_id = $1",
                    customer_id
                );
                if (result.empty()) {
                    return std::nullopt;
                }
                return profile_from_row(result[0]);
            } catch (const RiskEngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("profile lookup failed: ") + e.what());
            }
        }

        RiskProfile save(const RiskProfile& profile) override {
            RiskProfile stored = profile;
            if (stored.id.empty()) {
                stored.id = util::generate_uuid();
            }
            std::string last_assessed = stored.last_assessed_at ? util::format_iso8601(*stored.last_assessed_at) : "";

            pqxx::result result;
            try {
                if (profile.version == 0) {
                    result = s_.work().exec_params(
                        "INSERT INTO risk_profiles "
                        "(id, customer_id, current_score, category, last_assessed_at, created_at, version) "
                        "VALUES ($1, $2, $3, $4, NULLIF($5, '')::timestamptz, $6::timestamptz, 1) "
                        "ON CONFLICT (customer_id) DO NOTHING",
                        stored.id,
                        stored.customer_id,
                        stored.current_score,
                        to_string(stored.category),
                        last_assessed,
                        util::format_iso8601(stored.created_at)
                    );
                } else {
                    result = s_.work().exec_params(
                        "UPDATE risk_profiles SET current_score = $1, category = $2, "
                        "last_assessed_at = NULLIF($3, '')::timestamptz, version = version + 1 "
                        "WHERE customer_id = $4 AND version = $5",
                        stored.current_score,
                        to_string(stored.category),
                        last_assessed,
                        stored.customer_id,
                        profile.version
                    );
                }
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("profile save failed: ") + e.what());
            }

            if (result.affected_rows() == 0) {
                throw ConcurrencyConflictError(profile.customer_id, profile.version);
            }

            stored.version = profile.version + 1;
            return stored;
        }

    private:
        PgStoreSession& s_;
    };

    class Factors : public FactorStore {
    public:
        explicit Factors(PgStoreSession& s) : s_(s) {}

        std::vector<RiskFactor> find_by_profile(const std::string& profile_id) override {
            std::vector<RiskFactor> factors;
            try {
                pqxx::result result = s_.work().exec_params(
                    "SELECT name, score, weight, description, data_source, " +
                    iso_column("calculated_at") + " AS calculated_at "
                    "FROM risk_factors WHERE profile_id = $1 ORDER BY weight DESC, name",
                    profile_id
                );
                for (const auto& row : result) {
                    RiskFactor factor;
                    factor.name = row["name"].as<std::string>();
                    factor.score = row["score"].as<double>();
                    factor.weight = row["weight"].as<double>();
                    factor.description = row["description"].as<std::string>();
                    factor.data_source = row["data_source"].as<std::string>();
                    factor.profile_id = profile_id;
                    factor.calculated_at = util::parse_iso8601(row["calculated_at"].as<std::string>());
                    factors.push_back(factor);
                }
            } catch (const RiskEngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("factor lookup failed: ") + e.what());
            }
            return factors;
        }

        void save(const std::string& profile_id, const std::vector<RiskFactor>& factors) override {
            try {
                auto& txn = s_.work();
                txn.exec_params("DELETE FROM risk_factors WHERE profile_id = $1", profile_id);
                for (const auto& factor : factors) {
                    txn.exec_params(
                        "INSERT INTO risk_factors "
                        "(profile_id, name, score, weight, description, data_source, calculated_at) "
                        "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz)",
                        profile_id,
                        factor.name,
                        factor.score,
                        factor.weight,
                        factor.description,
                        factor.data_source,
                        util::format_iso8601(factor.calculated_at)
                    );
                }
            } catch (const RiskEngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("factor save failed: ") + e.what());
            }
        }

    private:
        PgStoreSession& s_;
    };

    class Scores : public ScoreStore {
    public:
        explicit Scores(PgStoreSession& s) : s_(s) {}

        void save(const RiskScore& score) override {
            try {
                s_.work().exec_params(
                    "INSERT INTO risk_scores "
                    "(id, assessment_id, profile_id, score, category, confidence, assessment_date) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz)",
                    score.id,
                    score.assessment_id,
                    score.profile_id,
                    score.score,
                    to_string(score.category),
                    score.confidence,
                    util::format_iso8601(score.assessment_date)
                );
            } catch (const RiskEngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("score save failed: ") + e.what());
            }
        }

    private:
        PgStoreSession& s_;
    };

    class Alerts : public AlertStore {
    public:
        explicit Alerts(PgStoreSession& s) : s_(s) {}

        void save(const FraudAlert& alert) override {
            try {
                s_.work().exec_params(
                    "INSERT INTO fraud_alerts "
                    "(id, transaction_id, customer_id, reason, risk_score_ref, status, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz)",
                    alert.id,
                    alert.transaction_id,
                    alert.customer_id,
                    alert.reason,
                    alert.risk_score_ref,
                    to_string(alert.status),
                    util::format_iso8601(alert.timestamp)
                );
            } catch (const RiskEngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw PersistenceError(std::string("alert save failed: ") + e.what());
            }
        }

    private:
        PgStoreSession& s_;
    };

    PostgresRiskRepository::Impl& pool_;
    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> txn_;
    Profiles profiles_;
    Factors factors_;
    Scores scores_;
    Alerts alerts_;
};

PostgresRiskRepository::PostgresRiskRepository(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

PostgresRiskRepository::~PostgresRiskRepository() = default;

std::unique_ptr<StoreSession> PostgresRiskRepository::open_session() {
    return std::make_unique<PgStoreSession>(*impl_, impl_->lease());
}

bool PostgresRiskRepository::is_healthy() {
    try {
        auto conn = impl_->lease();
        bool healthy = false;
        try {
            pqxx::nontransaction n(*conn);
            n.exec("SELECT 1");
            healthy = true;
        } catch (const std::exception& e) {
            spdlog::error("PostgreSQL health check failed: {}", e.what());
        }
        impl_->release(std::move(conn));
        return healthy;
    } catch (const std::exception& e) {
        spdlog::error("PostgreSQL health check failed: {}", e.what());
        return false;
    }
}

void PostgresRiskRepository::ensure_schema() {
    auto conn = impl_->lease();
    try {
        pqxx::work txn(*conn);
        txn.exec(kSchema);
        txn.commit();
        spdlog::info("PostgreSQL schema ready");
    } catch (const std::exception& e) {
        impl_->release(std::move(conn));
        throw PersistenceError(std::string("schema bootstrap failed: ") + e.what());
    }
    impl_->release(std::move(conn));
}
