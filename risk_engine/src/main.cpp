#include "assessment_service.hpp"
#include "command_handler.hpp"
#include "config.hpp"
#include "event_publisher.hpp"
#include "health.hpp"
#include "heuristic_backend.hpp"
#include "http_scoring_backend.hpp"
#include "memory_store.hpp"
#include "pg_store.hpp"
#include "redis_bus.hpp"
#include "redis_window_store.hpp"
#include "risk_assessment_engine.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

// Signal handler function
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main() {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("risk_engine", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    spdlog::info("Starting Risk Assessment Engine...");

    Config config;
    try {
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded: store={}, window={}, scoring={}",
                     config.store_backend, config.window_backend, config.scoring_backend);
    } catch (const std::exception& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    // Register signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<RiskRepository> repository;
    std::unique_ptr<TransactionWindowStore> window_store;
    std::unique_ptr<FraudScoringBackend> scoring_backend;
    std::unique_ptr<RedisBus> bus;
    std::unique_ptr<AsyncEventPublisher> publisher;
    std::unique_ptr<RiskAssessmentEngine> engine;
    std::unique_ptr<CommandHandler> handler;
    std::unique_ptr<AssessmentService> service;
    std::unique_ptr<HealthChecker> health;

    try {
        std::vector<std::pair<std::string, HealthChecker::Probe>> probes;

        if (config.store_backend == "postgres") {
            auto pg = std::make_unique<PostgresRiskRepository>(config);
            pg->ensure_schema();
            repository = std::move(pg);
        } else {
            spdlog::warn("Using in-memory risk store; data is lost on restart");
            repository = std::make_unique<MemoryRiskRepository>();
        }
        probes.emplace_back("store", [&repository] { return repository->is_healthy(); });

        if (config.window_backend == "redis") {
            auto redis_window = std::make_unique<RedisWindowStore>(config);
            RedisWindowStore* raw = redis_window.get();
            probes.emplace_back("window", [raw] { return raw->is_healthy(); });
            window_store = std::move(redis_window);
        } else {
            window_store = std::make_unique<MemoryWindowStore>();
        }

        if (config.scoring_backend == "http") {
            scoring_backend = std::make_unique<HttpScoringBackend>(config);
        } else {
            scoring_backend = std::make_unique<HeuristicScoringBackend>();
        }

        bus = std::make_unique<RedisBus>(config);
        probes.emplace_back("redis", [&bus] { return bus->is_connected(); });

        publisher = std::make_unique<AsyncEventPublisher>(
            *bus, static_cast<size_t>(config.publish_queue_capacity),
            std::chrono::milliseconds(config.publish_timeout_ms));

        engine = std::make_unique<RiskAssessmentEngine>(config, *repository, *scoring_backend,
                                                        *window_store, *publisher);
        handler = std::make_unique<CommandHandler>(*engine);

        service = std::make_unique<AssessmentService>(config, *bus, *handler);
        service->run();

        health = std::make_unique<HealthChecker>(config, std::move(probes));
        health->start();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    // Wait for termination signal
    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");

    service->stop();
    publisher->stop();
    health->stop();

    spdlog::info("Risk Assessment Engine has shut down gracefully.");
    spdlog::shutdown();
    return 0;
}
