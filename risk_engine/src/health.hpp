#pragma once

#include "config.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// GET /health on its own thread. Each component probe is reported by name; the
// service answers 503 as soon as one probe fails.
class HealthChecker {
public:
    using Probe = std::function<bool()>;

    HealthChecker(const Config& config, std::vector<std::pair<std::string, Probe>> probes);
    ~HealthChecker();

    void start();
    void stop();

    // Non-copyable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
