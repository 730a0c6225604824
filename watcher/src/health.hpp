#pragma once

#include "redis_bus.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct HealthSnapshot {
    std::string state = "idle";
    int cycles = 0;
    std::optional<TimePoint> last_cycle;
    int calls_used = 0;
    int daily_ceiling = 0;
    size_t seen_items = 0;
    size_t last_new = 0;
    size_t last_drops = 0;
    int consecutive_failures = 0;
    bool anomaly = false;
};

class HealthCheck {
public:
    HealthCheck(RedisBus* redis, std::string service_name, std::chrono::seconds stale_after);

    void update(const HealthSnapshot& snapshot);
    HealthSnapshot snapshot() const;

    nlohmann::json get_status(TimePoint now) const;
    bool is_healthy(TimePoint now) const;

private:
    RedisBus* redis_;
    std::string service_name_;
    std::chrono::seconds stale_after_;

    mutable std::mutex mutex_;
    HealthSnapshot snapshot_;
    TimePoint started_at_;

    bool cycle_fresh(TimePoint now) const;
};

// GET /health on a background thread. Port 0 binds any free port.
class HealthServer {
public:
    HealthServer(HealthCheck& health, std::string listen_addr, int listen_port);
    ~HealthServer();

    bool start();
    void stop();
    int port() const { return bound_port_; }

private:
    HealthCheck& health_;
    std::string listen_addr_;
    int listen_port_;
    int bound_port_ = 0;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};
