#include "redis_bus.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <iterator>
#include <thread>
#include <unordered_map>

using json = nlohmann::json;

class RedisBus::Impl {
public:
    Impl(const Config& config)
        : config_(config), running_(false), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        stop_subscribers();
        disconnect();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return connect_locked();
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return ping_locked();
    }

    bool ensure_connection() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (ping_locked()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;

        if (connect_locked()) {
            spdlog::info("Redis connection restored");
            return true;
        }
        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
        if (command_thread_.joinable()) {
            spdlog::warn("Command requests subscriber already running");
            return;
        }

        running_ = true;
        command_thread_ = std::thread([this, callback]() {
            spdlog::info("Starting assessment request subscriber on {}", config_.stream_requests);

            sw::redis::ConnectionOptions opts;
            opts.uri = config_.redis_url;
            opts.socket_timeout = std::chrono::milliseconds(2000);

            sw::redis::Redis redis(opts);

            // Create a consumer group if it doesn't exist
            try {
                redis.xgroup_create(config_.stream_requests, config_.consumer_group, "0", true);
            } catch (const std::exception& e) {
                spdlog::debug("Consumer group already exists or error: {}", e.what());
            }

            std::string consumer_id = config_.service_name + "_" +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

            using Attrs = std::unordered_map<std::string, std::string>;
            using Item = std::pair<std::string, Attrs>;
            using ItemStream = std::vector<Item>;

            while (running_) {
                try {
                    std::unordered_map<std::string, ItemStream> result;
                    redis.xreadgroup(config_.consumer_group, consumer_id, config_.stream_requests, ">",
                                     std::chrono::milliseconds(1000), 10,
                                     std::inserter(result, result.end()));

                    for (const auto& [stream, items] : result) {
                        for (const auto& [id, fields] : items) {
                            try {
                                auto data = fields.find("data");
                                if (data != fields.end()) {
                                    auto request = CommandRequest::from_json(json::parse(data->second));
                                    callback(request);
                                } else {
                                    spdlog::warn("Ignoring request {} without data field", id);
                                }
                            } catch (const std::exception& e) {
                                spdlog::error("Error processing assessment request {}: {}", id, e.what());
                            }

                            // Acknowledge the message
                            redis.xack(config_.stream_requests, config_.consumer_group, id);
                        }
                    }
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                } catch (const std::exception& e) {
                    spdlog::error("Error in assessment request subscriber: {}", e.what());
                    std::this_thread::sleep_for(std::chrono::seconds(1));
                }
            }

            spdlog::info("Assessment request subscriber stopped");
        });
    }

    void stop_subscribers() {
        running_ = false;

        if (command_thread_.joinable()) {
            command_thread_.join();
        }
    }

    bool publish_command_reply(const CommandReply& reply) {
        if (!ensure_connection()) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", reply.to_json().dump()},
                {"corr_id", reply.corr_id},
                {"timestamp", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    reply.timestamp.time_since_epoch()).count())}
            };

            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (!redis_) {
                spdlog::error("Failed to publish command reply: Redis disconnected");
                return false;
            }
            redis_->xadd(config_.stream_replies, "*", fields.begin(), fields.end());
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish command reply: {}", e.what());
            return false;
        }
    }

    void send(const std::string& topic, const std::string& key, const json& event) {
        if (!ensure_connection()) {
            throw PublishError("Redis unavailable for topic " + topic);
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", event.dump()},
                {"key", key},
                {"timestamp", util::current_iso8601()}
            };

            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (!redis_) {
                throw PublishError("Redis disconnected");
            }
            redis_->xadd(topic, "*", fields.begin(), fields.end());
        } catch (const PublishError&) {
            throw;
        } catch (const std::exception& e) {
            throw PublishError(topic + ": " + e.what());
        }
    }

private:
    bool connect_locked() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;  // Reset backoff on successful connection
            retry_count_ = 0;
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    bool ping_locked() const {
        if (!redis_) return false;

        try {
            redis_->ping();
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    const Config& config_;
    mutable std::mutex conn_mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread command_thread_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::connect() {
    return impl_->connect();
}

void RedisBus::disconnect() {
    impl_->disconnect();
}

bool RedisBus::is_connected() const {
    return impl_->is_connected();
}

bool RedisBus::ensure_connection() {
    return impl_->ensure_connection();
}

void RedisBus::subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
    impl_->subscribe_command_requests(std::move(callback));
}

void RedisBus::stop_subscribers() {
    impl_->stop_subscribers();
}

bool RedisBus::publish_command_reply(const CommandReply& reply) {
    return impl_->publish_command_reply(reply);
}

void RedisBus::send(const std::string& topic, const std::string& key, const nlohmann::json& event) {
    impl_->send(topic, key, event);
}
