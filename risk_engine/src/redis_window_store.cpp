#include "redis_window_store.hpp"
#include "errors.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iterator>

RedisWindowStore::RedisWindowStore(const Config& config)
    : config_(config), redis_(std::make_unique<sw::redis::Redis>(config.redis_url)) {}

RedisWindowStore::~RedisWindowStore() = default;

std::string RedisWindowStore::index_key(const std::string& customer_id) const {
    return "risk:window:" + customer_id;
}

std::string RedisWindowStore::entries_key(const std::string& customer_id) const {
    return "risk:window:" + customer_id + ":entries";
}

std::vector<WindowEntry> RedisWindowStore::load(const std::string& customer_id, int max_entries) {
    if (max_entries <= 0) {
        return {};
    }

    std::vector<std::string> ids;
    std::vector<sw::redis::OptionalString> raw;
    try {
        redis_->zrange(index_key(customer_id), -max_entries, -1, std::back_inserter(ids));
        if (ids.empty()) {
            return {};
        }
        redis_->hmget(entries_key(customer_id), ids.begin(), ids.end(), std::back_inserter(raw));
    } catch (const sw::redis::Error& e) {
        throw PersistenceError(std::string("window load failed: ") + e.what());
    }

    std::vector<WindowEntry> entries;
    entries.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (!raw[i]) {
            spdlog::warn("Window entry {} for customer {} has no payload", ids[i], customer_id);
            continue;
        }
        try {
            entries.push_back(WindowEntry::from_json(nlohmann::json::parse(*raw[i])));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed window entry for customer {}: {}", customer_id, e.what());
        }
    }
    return entries;
}

void RedisWindowStore::append(const std::string& customer_id, const WindowEntry& entry, int max_entries) {
    auto ttl = std::chrono::hours(config_.window_ttl_hours);
    auto timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count();

    try {
        auto index = index_key(customer_id);
        auto entries = entries_key(customer_id);

        // Same id, same member and field: a replayed append overwrites itself
        auto tx = redis_->transaction();
        tx.zadd(index, entry.transaction_id, static_cast<double>(timestamp_ms))
          .hset(entries, entry.transaction_id, entry.to_json().dump())
          .expire(index, ttl)
          .expire(entries, ttl)
          .exec();

        trim(customer_id, max_entries);
    } catch (const sw::redis::Error& e) {
        throw PersistenceError(std::string("window append failed: ") + e.what());
    }
}

void RedisWindowStore::trim(const std::string& customer_id, int max_entries) {
    auto index = index_key(customer_id);

    // Everything older than the newest max_entries ids
    std::vector<std::string> expired;
    redis_->zrange(index, 0, -(static_cast<long long>(std::max(0, max_entries)) + 1),
                   std::back_inserter(expired));
    if (expired.empty()) {
        return;
    }

    auto tx = redis_->transaction();
    tx.zrem(index, expired.begin(), expired.end())
      .hdel(entries_key(customer_id), expired.begin(), expired.end())
      .exec();
    spdlog::debug("Trimmed {} window entries for customer {}", expired.size(), customer_id);
}

bool RedisWindowStore::is_healthy() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Redis window store health check failed: {}", e.what());
        return false;
    }
}
