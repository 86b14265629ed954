#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthChecker::Impl {
public:
    Impl(const Config& config, std::vector<std::pair<std::string, Probe>> probes)
        : config_(config), probes_(std::move(probes)), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();
            health_status["components"] = nlohmann::json::object();

            bool healthy = true;
            for (const auto& [name, probe] : probes_) {
                bool ok = false;
                try {
                    ok = probe();
                } catch (const std::exception& e) {
                    spdlog::warn("Health probe {} failed: {}", name, e.what());
                }
                health_status["components"][name] = ok ? "healthy" : "unhealthy";
                healthy = healthy && ok;
            }

            if (!healthy) {
                health_status["status"] = "unhealthy";
                res.status = 503;
            } else {
                res.status = 200;
            }

            res.set_content(health_status.dump(2), "application/json");
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server could not bind {}:{}", config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    Config config_;
    std::vector<std::pair<std::string, Probe>> probes_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthChecker::HealthChecker(const Config& config, std::vector<std::pair<std::string, Probe>> probes)
    : pImpl_(std::make_unique<Impl>(config, std::move(probes))) {}

HealthChecker::~HealthChecker() = default;

void HealthChecker::start() {
    pImpl_->start();
}

void HealthChecker::stop() {
    pImpl_->stop();
}
