#pragma once

#include "alert_sink.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "heartbeat.hpp"
#include "pacing.hpp"
#include "quota_tracker.hpp"
#include "rate_limit_client.hpp"
#include "search_executor.hpp"
#include "search_spec.hpp"
#include "seen_store.hpp"
#include "shutdown.hpp"
#include "token_manager.hpp"
#include "util.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class CycleState {
    Idle,
    Running,
    Sleeping,
    ShuttingDown
};

const char* cycle_state_name(CycleState state);

struct SpecReport {
    std::string name;
    std::optional<ErrorKind> error;
    int attempts = 0;
    size_t listings = 0;
    size_t new_listings = 0;
    size_t price_drops = 0;
};

struct CycleReport {
    int cycle = 0;
    std::vector<SpecReport> specs;
    size_t new_listings = 0;
    size_t price_drops = 0;
    bool quota_anomaly = false;
    bool all_failed = false;
    std::chrono::seconds next_interval{0};
};

struct OrchestratorSettings {
    PacingSettings pacing;
    std::chrono::milliseconds sleep_tick{1000};
    int seen_retention_days = SeenStore::kDefaultRetentionDays;
    int alert_after_failures = 3;      // 0 disables the failure alert
};

using ClockFn = std::function<TimePoint()>;

// Drives the poll loop: Idle -> Running -> Sleeping -> Running ... and
// ShuttingDown once a stop request is seen between sleep ticks. A failing
// search never prevents the others in the same cycle from running.
class CycleOrchestrator {
public:
    CycleOrchestrator(std::vector<SearchSpec> specs,
                      SearchExecutor& executor,
                      TokenManager& tokens,
                      QuotaTracker& quota,
                      RateLimitClient& rate_limits,
                      SeenStore& seen,
                      AlertSink& alerts,
                      Heartbeat& heartbeat,
                      ShutdownSignal& shutdown,
                      OrchestratorSettings settings,
                      ClockFn clock,
                      Sleeper sleeper);

    void set_health(HealthCheck* health) { health_ = health; }

    // Loops until a shutdown request, then persists state and returns
    void run();

    CycleReport run_cycle();

    // Sleeps in ticks; returns true when a shutdown request interrupted it
    bool sleep_between_cycles(std::chrono::seconds interval);

    CycleState state() const { return state_; }
    int cycles_completed() const { return cycles_; }
    int consecutive_failures() const { return consecutive_failures_; }

private:
    std::vector<SearchSpec> specs_;
    SearchExecutor& executor_;
    TokenManager& tokens_;
    QuotaTracker& quota_;
    RateLimitClient& rate_limits_;
    SeenStore& seen_;
    AlertSink& alerts_;
    Heartbeat& heartbeat_;
    ShutdownSignal& shutdown_;
    HealthCheck* health_ = nullptr;
    OrchestratorSettings settings_;
    ClockFn clock_;
    Sleeper sleeper_;

    CycleState state_ = CycleState::Idle;
    int cycles_ = 0;
    int consecutive_failures_ = 0;
    std::optional<CycleReport> last_report_;
    std::optional<TimePoint> last_cycle_at_;

    SpecReport process_spec(const SearchSpec& spec, TimePoint now);
    void sync_quota(TimePoint now);
    void dispatch(const AlertBatch& batch, TimePoint now);
    bool notify_operator(const std::string& message, TimePoint now);
    void notify_limit_reached(TimePoint now);
    void persist_state();
    void shutdown_sequence();
    void publish_health();
    nlohmann::json heartbeat_details() const;
    int enabled_specs() const;
};
