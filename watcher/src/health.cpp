#include "health.hpp"
#include <spdlog/spdlog.h>

HealthCheck::HealthCheck(RedisBus* redis, std::string service_name, std::chrono::seconds stale_after)
    : redis_(redis)
    , service_name_(std::move(service_name))
    , stale_after_(stale_after)
    , started_at_(Clock::now())
{}

void HealthCheck::update(const HealthSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = snapshot;
}

HealthSnapshot HealthCheck::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

bool HealthCheck::cycle_fresh(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint reference = snapshot_.last_cycle ? *snapshot_.last_cycle : started_at_;
    return now - reference <= stale_after_;
}

nlohmann::json HealthCheck::get_status(TimePoint now) const {
    bool redis_ok = redis_ ? redis_->ping() : true;
    bool fresh = cycle_fresh(now);
    HealthSnapshot snap = snapshot();

    nlohmann::json status = {
        {"ok", redis_ok && fresh},
        {"redis", redis_ok},
        {"service", service_name_},
        {"state", snap.state},
        {"cycles", snap.cycles},
        {"calls_used", snap.calls_used},
        {"daily_ceiling", snap.daily_ceiling},
        {"seen_items", snap.seen_items},
        {"last_new", snap.last_new},
        {"last_drops", snap.last_drops},
        {"consecutive_failures", snap.consecutive_failures},
        {"quota_anomaly", snap.anomaly}
    };
    if (snap.last_cycle) {
        status["last_cycle"] = util::to_iso8601(*snap.last_cycle);
    }
    return status;
}

bool HealthCheck::is_healthy(TimePoint now) const {
    if (!cycle_fresh(now)) return false;
    return redis_ ? redis_->ping() : true;
}

HealthServer::HealthServer(HealthCheck& health, std::string listen_addr, int listen_port)
    : health_(health)
    , listen_addr_(std::move(listen_addr))
    , listen_port_(listen_port)
    , server_(std::make_unique<httplib::Server>())
{}

HealthServer::~HealthServer() {
    stop();
}

bool HealthServer::start() {
    if (running_) return true;

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto now = Clock::now();
        auto status = health_.get_status(now);
        res.status = status["ok"].get<bool>() ? 200 : 503;
        res.set_content(status.dump(), "application/json");
    });

    if (listen_port_ == 0) {
        bound_port_ = server_->bind_to_any_port(listen_addr_);
    } else if (server_->bind_to_port(listen_addr_, listen_port_)) {
        bound_port_ = listen_port_;
    }
    if (bound_port_ <= 0) {
        bound_port_ = 0;
        spdlog::error("Health server could not listen on {}:{}", listen_addr_, listen_port_);
        return false;
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting health server on {}:{}", listen_addr_, bound_port_);
        server_->listen_after_bind();
    });
    server_->wait_until_ready();
    return true;
}

void HealthServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    spdlog::info("Health server stopped");
}
