#pragma once

#include "util.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

struct QuotaState {
    std::string date;                          // provider day, YYYY-MM-DD Pacific
    int calls_used = 0;
    int api_limit = 5000;
    std::optional<int> api_remaining;          // unknown until first sync
    std::optional<TimePoint> reset_time_utc;   // next expected provider reset
    std::optional<TimePoint> last_sync;
    TimePoint last_update{};
    bool alert_sent = false;                   // limit-reached alert went out this day
};

void to_json(nlohmann::json& j, const QuotaState& q);
void from_json(const nlohmann::json& j, QuotaState& q);

struct QuotaSettings {
    int daily_ceiling = 4500;
    std::chrono::minutes anomaly_window{10};
    std::chrono::minutes sync_interval{30};
    int drift_tolerance = 10;
    std::string state_path;
};

// Daily call budget bookkeeping. The local counter only grows within a
// provider day and is reset exactly once per day boundary; provider syncs may
// correct it when the two disagree by more than the drift tolerance.
class QuotaTracker {
public:
    QuotaTracker(QuotaSettings settings, TimePoint now);

    bool can_spend(int n) const;
    void record_spend(int n, TimePoint now);

    void sync_with_provider(int limit, int remaining,
                            std::optional<TimePoint> reset_time,
                            TimePoint now);

    // Returns true when a reset was applied
    bool rollover_if_needed(TimePoint now);

    bool detect_sync_anomaly(TimePoint now) const;
    bool sync_due(TimePoint now) const;

    // Periodic sync is due, a reset boundary was crossed since the last one,
    // or the post-reset anomaly is present
    bool needs_resync(TimePoint now) const;

    // The operator hears about an exhausted budget once per provider day
    bool limit_alert_sent() const { return state_.alert_sent; }
    void mark_limit_alert_sent(TimePoint now);

    int remaining_budget() const;
    std::chrono::seconds time_until_reset(TimePoint now) const;
    TimePoint last_reset_boundary(TimePoint now) const;

    bool persist() const;

    const QuotaState& state() const { return state_; }
    const QuotaSettings& settings() const { return settings_; }

private:
    QuotaSettings settings_;
    QuotaState state_;
    bool stale_sync_ = false;

    static QuotaState fresh_state(TimePoint now);
};
