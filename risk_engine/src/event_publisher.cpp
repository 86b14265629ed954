#include "event_publisher.hpp"
#include <spdlog/spdlog.h>

AsyncEventPublisher::AsyncEventPublisher(EventSink& sink, size_t capacity,
                                         std::chrono::milliseconds enqueue_timeout)
    : sink_(sink), capacity_(capacity == 0 ? 1 : capacity), enqueue_timeout_(enqueue_timeout) {
    worker_thread_ = std::thread(&AsyncEventPublisher::worker_thread_func, this);
}

AsyncEventPublisher::~AsyncEventPublisher() {
    stop();
}

void AsyncEventPublisher::publish(const std::string& topic, const std::string& key,
                                  const nlohmann::json& event) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    bool has_room = not_full_cv_.wait_for(lock, enqueue_timeout_, [this] {
        return !running_ || queue_.size() < capacity_;
    });

    if (!running_ || !has_room) {
        dropped_++;
        spdlog::warn("Dropping event for topic {} key {}: publish queue {}",
                     topic, key, running_ ? "full" : "stopped");
        return;
    }

    queue_.push_back(PendingEvent{topic, key, event});
    lock.unlock();
    not_empty_cv_.notify_one();
}

void AsyncEventPublisher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    not_empty_cv_.notify_all();
    not_full_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    spdlog::info("Event publisher stopped ({} sent, {} dropped, {} failed)",
                 sent_.load(), dropped_.load(), failed_.load());
}

bool AsyncEventPublisher::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return drained_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !in_flight_;
    });
}

void AsyncEventPublisher::worker_thread_func() {
    spdlog::debug("Event publisher thread started");

    while (true) {
        PendingEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            not_empty_cv_.wait(lock, [this] {
                return !running_ || !queue_.empty();
            });

            // Drain what was accepted before stop()
            if (queue_.empty()) {
                break;
            }

            event = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }
        not_full_cv_.notify_one();

        try {
            sink_.send(event.topic, event.key, event.payload);
            sent_++;
        } catch (const std::exception& e) {
            failed_++;
            spdlog::error("Failed to publish event to {}: {}", event.topic, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_flight_ = false;
        }
        drained_cv_.notify_all();
    }

    spdlog::debug("Event publisher thread stopped");
}
