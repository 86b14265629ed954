#include "assessment_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

AssessmentService::AssessmentService(const Config& config, RedisBus& bus, CommandHandler& handler)
    : config_(config), bus_(bus), handler_(handler) {}

AssessmentService::~AssessmentService() {
    stop();
}

void AssessmentService::run() {
    if (running_) {
        spdlog::warn("Assessment service is already running");
        return;
    }

    running_ = true;

    // Queue requests for the service thread
    bus_.subscribe_command_requests([this](const CommandRequest& request) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            request_queue_.push(request);
        }
        queue_cv_.notify_one();
    });

    service_thread_ = std::thread(&AssessmentService::service_thread_func, this);

    spdlog::info("Assessment service started, consuming {}", config_.stream_requests);
}

void AssessmentService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Stop Redis subscriptions
    bus_.stop_subscribers();

    // Notify queue processor to exit
    queue_cv_.notify_all();

    // Wait for service thread to finish
    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    spdlog::info("Assessment service stopped");
}

void AssessmentService::service_thread_func() {
    spdlog::info("Assessment service thread started");

    while (running_) {
        CommandRequest request;

        // Get next request from queue
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::seconds(1), [this] {
                return !running_ || !request_queue_.empty();
            });

            if (!running_) {
                break;
            }

            if (request_queue_.empty()) {
                continue;
            }

            request = std::move(request_queue_.front());
            request_queue_.pop();
        }

        handle_command_request(request);
    }

    spdlog::info("Assessment service thread stopped");
}

void AssessmentService::handle_command_request(const CommandRequest& request) {
    auto started = std::chrono::steady_clock::now();
    CommandReply reply = handler_.handle(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::debug("Handled {} request {} in {} ms ({})", request.cmd, request.corr_id, elapsed,
                  reply.ok ? "ok" : reply.error_type);

    if (!bus_.publish_command_reply(reply)) {
        spdlog::error("Failed to publish reply for request {}", request.corr_id);
    }
}
