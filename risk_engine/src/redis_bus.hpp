#pragma once

#include "config.hpp"
#include "event_publisher.hpp"
#include "types.hpp"
#include <functional>
#include <memory>

// Redis streams transport: assessment requests in, replies and events out.
// Events go to a stream named after the topic, with the key as a field.
class RedisBus : public EventSink {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus() override;

    // Connection management
    bool connect();
    void disconnect();
    bool is_connected() const;
    bool ensure_connection();

    // Consumer-group reader on the request stream
    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback);
    void stop_subscribers();

    bool publish_command_reply(const CommandReply& reply);

    // EventSink. Throws PublishError.
    void send(const std::string& topic, const std::string& key, const nlohmann::json& event) override;

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
