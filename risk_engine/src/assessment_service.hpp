#pragma once

#include "command_handler.hpp"
#include "config.hpp"
#include "redis_bus.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

class AssessmentService {
public:
    AssessmentService(const Config& config, RedisBus& bus, CommandHandler& handler);
    ~AssessmentService();

    // Start the service
    void run();

    // Stop the service
    void stop();

private:
    // Service thread function
    void service_thread_func();

    // Handle command requests
    void handle_command_request(const CommandRequest& request);

    const Config& config_;
    RedisBus& bus_;
    CommandHandler& handler_;

    // Thread management
    std::atomic<bool> running_{false};
    std::thread service_thread_;

    // Request queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<CommandRequest> request_queue_;
};
