#include <gtest/gtest.h>
#include "redis_window_store.hpp"
#include "test_fixtures.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <memory>

// Runs against REDIS_URL; skipped when no server answers
class RedisWindowStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.load_from_env();
        store = std::make_unique<RedisWindowStore>(config);
        if (!store->is_healthy()) {
            GTEST_SKIP() << "no Redis at " << config.redis_url;
        }
        redis = std::make_unique<sw::redis::Redis>(config.redis_url);
        customer_id = "test-" + util::generate_uuid();
    }

    void TearDown() override {
        if (redis) {
            redis->del("risk:window:" + customer_id);
            redis->del("risk:window:" + customer_id + ":entries");
        }
    }

    WindowEntry entry(int i) {
        return WindowEntry{"t-" + std::to_string(i), 100.0 * (i + 1),
                           fixtures::base_time() + std::chrono::seconds(i)};
    }

    Config config;
    std::unique_ptr<RedisWindowStore> store;
    std::unique_ptr<sw::redis::Redis> redis;
    std::string customer_id;
};

TEST_F(RedisWindowStoreTest, KeepsOnlyTheNewestEntriesInBothStructures) {
    for (int i = 0; i < 15; ++i) {
        store->append(customer_id, entry(i), 10);
    }

    auto loaded = store->load(customer_id, 10);
    ASSERT_EQ(loaded.size(), 10u);
    EXPECT_EQ(loaded.front().transaction_id, "t-5");
    EXPECT_EQ(loaded.back().transaction_id, "t-14");

    EXPECT_EQ(redis->zcard("risk:window:" + customer_id), 10);
    EXPECT_EQ(redis->hlen("risk:window:" + customer_id + ":entries"), 10);
}

TEST_F(RedisWindowStoreTest, ReplayedAppendIsIgnored) {
    store->append(customer_id, entry(0), 10);
    store->append(customer_id, entry(1), 10);
    store->append(customer_id, entry(1), 10);

    auto loaded = store->load(customer_id, 10);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[1].transaction_id, "t-1");
    EXPECT_DOUBLE_EQ(loaded[1].amount, 200.0);
}

TEST_F(RedisWindowStoreTest, TrimmedIdCanBeRecordedAgain) {
    for (int i = 0; i < 3; ++i) {
        store->append(customer_id, entry(i), 2);
    }
    ASSERT_EQ(store->load(customer_id, 2).front().transaction_id, "t-1");

    auto late = entry(0);
    late.timestamp = fixtures::base_time() + std::chrono::seconds(10);
    store->append(customer_id, late, 2);

    auto loaded = store->load(customer_id, 2);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.back().transaction_id, "t-0");
}

TEST_F(RedisWindowStoreTest, UnknownCustomerHasEmptyWindow) {
    EXPECT_TRUE(store->load(customer_id, 10).empty());
}
