#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    // Best-effort. Implementations may throw PublishError.
    virtual void publish(const std::string& topic, const std::string& key, const nlohmann::json& event) = 0;
};

// Synchronous transport behind the async publisher (Redis streams in production)
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void send(const std::string& topic, const std::string& key, const nlohmann::json& event) = 0;
};

// Bounded queue drained by a single worker, so events leave in enqueue order.
// publish() waits at most `enqueue_timeout` for room, then drops the event.
class AsyncEventPublisher : public EventPublisher {
public:
    AsyncEventPublisher(EventSink& sink, size_t capacity, std::chrono::milliseconds enqueue_timeout);
    ~AsyncEventPublisher() override;

    void publish(const std::string& topic, const std::string& key, const nlohmann::json& event) override;

    // Delivers what is queued, then stops the worker
    void stop();

    // Blocks until the queue is empty or the timeout expires
    bool flush(std::chrono::milliseconds timeout);

    size_t sent_count() const { return sent_; }
    size_t dropped_count() const { return dropped_; }
    size_t failed_count() const { return failed_; }

private:
    struct PendingEvent {
        std::string topic;
        std::string key;
        nlohmann::json payload;
    };

    void worker_thread_func();

    EventSink& sink_;
    size_t capacity_;
    std::chrono::milliseconds enqueue_timeout_;

    std::mutex queue_mutex_;
    std::condition_variable not_empty_cv_;
    std::condition_variable not_full_cv_;
    std::condition_variable drained_cv_;
    std::deque<PendingEvent> queue_;
    bool in_flight_ = false;

    std::atomic<bool> running_{true};
    std::atomic<size_t> sent_{0};
    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> failed_{0};
    std::thread worker_thread_;
};
