#include "memory_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

class MemoryStoreSession : public StoreSession {
public:
    explicit MemoryStoreSession(MemoryRiskRepository& repo)
        : repo_(repo), profiles_(*this), factors_(*this), scores_(*this), alerts_(*this) {}

    ~MemoryStoreSession() override {
        if (!finished_) {
            rollback();
        }
    }

    ProfileStore& profiles() override { return profiles_; }
    FactorStore& factors() override { return factors_; }
    ScoreStore& scores() override { return scores_; }
    AlertStore& alerts() override { return alerts_; }

    void commit() override {
        if (finished_) {
            throw PersistenceError("session already finished");
        }

        std::lock_guard<std::mutex> lock(repo_.mutex_);

        // Re-check every staged profile against what other sessions committed meanwhile
        for (const auto& [customer_id, base_version] : base_versions_) {
            auto it = repo_.profiles_.find(customer_id);
            long committed = it == repo_.profiles_.end() ? 0 : it->second.version;
            if (committed != base_version) {
                ConcurrencyConflictError conflict(customer_id, base_version);
                finished_ = true;
                clear();
                throw conflict;
            }
        }

        for (const auto& [customer_id, profile] : staged_profiles_) {
            repo_.profiles_[customer_id] = profile;
        }
        for (const auto& [profile_id, factors] : staged_factors_) {
            repo_.factors_[profile_id] = factors;
        }
        repo_.scores_.insert(repo_.scores_.end(), staged_scores_.begin(), staged_scores_.end());
        repo_.alerts_.insert(repo_.alerts_.end(), staged_alerts_.begin(), staged_alerts_.end());

        finished_ = true;
        clear();
    }

    void rollback() override {
        if (!staged_profiles_.empty() || !staged_scores_.empty() || !staged_alerts_.empty()) {
            spdlog::debug("Rolling back memory session ({} profiles, {} scores, {} alerts staged)",
                          staged_profiles_.size(), staged_scores_.size(), staged_alerts_.size());
        }
        finished_ = true;
        clear();
    }

private:
    class Profiles : public ProfileStore {
    public:
        explicit Profiles(MemoryStoreSession& s) : s_(s) {}

        std::optional<RiskProfile> find_by_customer_id(const std::string& customer_id) override {
            auto staged = s_.staged_profiles_.find(customer_id);
            if (staged != s_.staged_profiles_.end()) {
                return staged->second;
            }
            std::lock_guard<std::mutex> lock(s_.repo_.mutex_);
            auto it = s_.repo_.profiles_.find(customer_id);
            if (it == s_.repo_.profiles_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        RiskProfile save(const RiskProfile& profile) override {
            s_.ensure_open();

            std::optional<RiskProfile> current;
            long committed_version = 0;
            {
                std::lock_guard<std::mutex> lock(s_.repo_.mutex_);
                auto it = s_.repo_.profiles_.find(profile.customer_id);
                if (it != s_.repo_.profiles_.end()) {
                    current = it->second;
                    committed_version = it->second.version;
                }
            }
            auto staged = s_.staged_profiles_.find(profile.customer_id);
            if (staged != s_.staged_profiles_.end()) {
                current = staged->second;
            }

            long current_version = current ? current->version : 0;
            if (current_version != profile.version) {
                throw ConcurrencyConflictError(profile.customer_id, profile.version);
            }

            RiskProfile stored = profile;
            if (stored.id.empty()) {
                stored.id = util::generate_uuid();
            }
            stored.version = profile.version + 1;

            s_.base_versions_.emplace(profile.customer_id, committed_version);
            s_.staged_profiles_[profile.customer_id] = stored;
            return stored;
        }

    private:
        MemoryStoreSession& s_;
    };

    class Factors : public FactorStore {
    public:
        explicit Factors(MemoryStoreSession& s) : s_(s) {}

        std::vector<RiskFactor> find_by_profile(const std::string& profile_id) override {
            auto staged = s_.staged_factors_.find(profile_id);
            if (staged != s_.staged_factors_.end()) {
                return staged->second;
            }
            return s_.repo_.factors(profile_id);
        }

        void save(const std::string& profile_id, const std::vector<RiskFactor>& factors) override {
            s_.ensure_open();
            s_.staged_factors_[profile_id] = factors;
        }

    private:
        MemoryStoreSession& s_;
    };

    class Scores : public ScoreStore {
    public:
        explicit Scores(MemoryStoreSession& s) : s_(s) {}

        void save(const RiskScore& score) override {
            s_.ensure_open();
            s_.staged_scores_.push_back(score);
        }

    private:
        MemoryStoreSession& s_;
    };

    class Alerts : public AlertStore {
    public:
        explicit Alerts(MemoryStoreSession& s) : s_(s) {}

        void save(const FraudAlert& alert) override {
            s_.ensure_open();
            s_.staged_alerts_.push_back(alert);
        }

    private:
        MemoryStoreSession& s_;
    };

    void ensure_open() const {
        if (finished_) {
            throw PersistenceError("session already finished");
        }
    }

    void clear() {
        staged_profiles_.clear();
        base_versions_.clear();
        staged_factors_.clear();
        staged_scores_.clear();
        staged_alerts_.clear();
    }

    MemoryRiskRepository& repo_;
    Profiles profiles_;
    Factors factors_;
    Scores scores_;
    Alerts alerts_;

    bool finished_ = false;
    std::map<std::string, RiskProfile> staged_profiles_;
    std::map<std::string, long> base_versions_;
    std::map<std::string, std::vector<RiskFactor>> staged_factors_;
    std::vector<RiskScore> staged_scores_;
    std::vector<FraudAlert> staged_alerts_;
};

std::unique_ptr<StoreSession> MemoryRiskRepository::open_session() {
    return std::make_unique<MemoryStoreSession>(*this);
}

std::optional<RiskProfile> MemoryRiskRepository::profile(const std::string& customer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(customer_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RiskFactor> MemoryRiskRepository::factors(const std::string& profile_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factors_.find(profile_id);
    if (it == factors_.end()) {
        return {};
    }
    return it->second;
}

std::vector<RiskScore> MemoryRiskRepository::scores(const std::string& profile_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RiskScore> result;
    std::copy_if(scores_.begin(), scores_.end(), std::back_inserter(result),
                 [&](const RiskScore& s) { return s.profile_id == profile_id; });
    return result;
}

std::vector<FraudAlert> MemoryRiskRepository::alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_;
}

size_t MemoryRiskRepository::profile_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

std::vector<WindowEntry> MemoryWindowStore::load(const std::string& customer_id, int max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(customer_id);
    if (it == windows_.end()) {
        return {};
    }

    const auto& window = it->second;
    size_t count = std::min(window.size(), static_cast<size_t>(std::max(0, max_entries)));
    return std::vector<WindowEntry>(window.end() - count, window.end());
}

void MemoryWindowStore::append(const std::string& customer_id, const WindowEntry& entry, int max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[customer_id];

    bool seen = std::any_of(window.begin(), window.end(), [&](const WindowEntry& e) {
        return e.transaction_id == entry.transaction_id;
    });
    if (seen) {
        return;
    }

    window.push_back(entry);
    while (static_cast<int>(window.size()) > max_entries) {
        window.pop_front();
    }
}
