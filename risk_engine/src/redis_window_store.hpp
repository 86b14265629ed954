#pragma once

#include "config.hpp"
#include "stores.hpp"
#include <memory>

namespace sw {
namespace redis {
class Redis;
}
}

// Per-customer window shared by every engine instance. A sorted set of
// transaction ids ordered by timestamp indexes a hash of JSON entries; both are
// written and trimmed together in one MULTI, so re-appending an id is a no-op.
class RedisWindowStore : public TransactionWindowStore {
public:
    explicit RedisWindowStore(const Config& config);
    ~RedisWindowStore() override;

    std::vector<WindowEntry> load(const std::string& customer_id, int max_entries) override;
    void append(const std::string& customer_id, const WindowEntry& entry, int max_entries) override;

    bool is_healthy();

private:
    std::string index_key(const std::string& customer_id) const;
    std::string entries_key(const std::string& customer_id) const;
    void trim(const std::string& customer_id, int max_entries);

    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
};
