#include "quota_tracker.hpp"
#include "provider_day.hpp"
#include "state_store.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace {

nlohmann::json optional_time(const std::optional<TimePoint>& tp) {
    if (!tp) return nullptr;
    return util::to_iso8601(*tp);
}

std::optional<TimePoint> read_optional_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return util::parse_iso8601(j.at(key).get<std::string>());
}

} // namespace

void to_json(nlohmann::json& j, const QuotaState& q) {
    j = nlohmann::json{
        {"date", q.date},
        {"calls_used", q.calls_used},
        {"api_limit", q.api_limit},
        {"api_remaining", q.api_remaining ? nlohmann::json(*q.api_remaining) : nlohmann::json(nullptr)},
        {"reset_time_utc", optional_time(q.reset_time_utc)},
        {"last_sync", optional_time(q.last_sync)},
        {"last_update", util::to_iso8601(q.last_update)},
        {"alert_sent", q.alert_sent}
    };
}

void from_json(const nlohmann::json& j, QuotaState& q) {
    q.date = j.at("date").get<std::string>();
    q.calls_used = j.at("calls_used").get<int>();
    q.api_limit = j.value("api_limit", 5000);
    if (j.contains("api_remaining") && !j.at("api_remaining").is_null()) {
        q.api_remaining = j.at("api_remaining").get<int>();
    }
    q.reset_time_utc = read_optional_time(j, "reset_time_utc");
    q.last_sync = read_optional_time(j, "last_sync");
    q.last_update = read_optional_time(j, "last_update").value_or(TimePoint{});
    q.alert_sent = j.value("alert_sent", false);
}

QuotaState QuotaTracker::fresh_state(TimePoint now) {
    QuotaState state;
    state.date = provider_day::pacific_date(now);
    state.last_update = now;
    return state;
}

QuotaTracker::QuotaTracker(QuotaSettings settings, TimePoint now)
    : settings_(std::move(settings))
    , state_(fresh_state(now))
{
    if (!settings_.state_path.empty()) {
        state_ = StateStore::load(settings_.state_path, fresh_state(now));
        if (state_.calls_used < 0) {
            spdlog::error("Quota file has negative call count, starting fresh");
            state_ = fresh_state(now);
        }
    }
    spdlog::info("Quota for {}: {}/{} calls used", state_.date, state_.calls_used,
                 settings_.daily_ceiling);
}

bool QuotaTracker::can_spend(int n) const {
    if (n <= 0) return true;
    if (state_.calls_used + n > settings_.daily_ceiling) return false;
    if (state_.api_remaining && *state_.api_remaining < n) return false;
    return true;
}

void QuotaTracker::record_spend(int n, TimePoint now) {
    if (n <= 0) return;

    state_.calls_used += n;
    if (state_.api_remaining) {
        state_.api_remaining = std::max(0, *state_.api_remaining - n);
    }
    state_.last_update = now;

    if (state_.calls_used >= settings_.daily_ceiling) {
        spdlog::warn("Daily call ceiling reached ({}/{})", state_.calls_used, settings_.daily_ceiling);
    }
    persist();
}

void QuotaTracker::sync_with_provider(int limit, int remaining,
                                      std::optional<TimePoint> reset_time,
                                      TimePoint now) {
    state_.api_limit = limit;
    state_.api_remaining = remaining;
    state_.last_sync = now;
    state_.last_update = now;

    // A reset time already behind us means the provider is still serving
    // yesterday's numbers; keep our own boundary and leave the counter alone.
    stale_sync_ = reset_time && *reset_time <= now;
    if (stale_sync_) {
        spdlog::warn("Provider reports reset at {} which has already passed; quota data may lag",
                     util::to_iso8601(*reset_time));
        persist();
        return;
    }

    if (reset_time) {
        state_.reset_time_utc = reset_time;
    }

    int implied_used = limit - remaining;
    int drift = implied_used - state_.calls_used;
    if (std::abs(drift) > settings_.drift_tolerance) {
        spdlog::warn("Quota drift of {} calls (local {}, provider {}), adopting provider count",
                     drift, state_.calls_used, implied_used);
        state_.calls_used = std::max(0, implied_used);
    }

    spdlog::info("Quota synced: {}/{} remaining, resets {}", remaining, limit,
                 state_.reset_time_utc ? util::to_iso8601(*state_.reset_time_utc) : "unknown");
    persist();
}

bool QuotaTracker::rollover_if_needed(TimePoint now) {
    const std::string today = provider_day::pacific_date(now);

    // Once the provider has told us its reset time, that boundary alone
    // decides; the Pacific date is the fallback when it is unknown
    const char* reason = nullptr;
    std::string new_date = today;
    if (state_.reset_time_utc) {
        if (now < *state_.reset_time_utc) return false;
        reason = "provider reset time passed";
        // The day that begins at the boundary, even if our clock has not reached it
        new_date = std::max(today, provider_day::pacific_date(*state_.reset_time_utc + std::chrono::minutes(1)));
    } else if (state_.date < today) {
        reason = "provider day changed";
    } else {
        return false;
    }

    spdlog::info("Quota rollover ({}): {} -> {}, {} calls used on previous day",
                 reason, state_.date, new_date, state_.calls_used);

    state_.date = new_date;
    state_.calls_used = 0;
    state_.api_remaining.reset();
    state_.alert_sent = false;
    stale_sync_ = false;

    // A boundary reported slightly ahead of our clock must not produce a
    // second reset at the local midnight right after it
    TimePoint next_reset = provider_day::next_pacific_midnight(now);
    if (state_.reset_time_utc && next_reset - *state_.reset_time_utc < std::chrono::hours(2)) {
        next_reset = provider_day::next_pacific_midnight(next_reset + std::chrono::hours(1));
    }
    state_.reset_time_utc = next_reset;
    state_.last_update = now;

    persist();
    return true;
}

TimePoint QuotaTracker::last_reset_boundary(TimePoint now) const {
    if (state_.reset_time_utc) {
        TimePoint boundary = *state_.reset_time_utc - std::chrono::hours(24);
        if (boundary <= now) {
            return boundary;
        }
    }
    return provider_day::last_pacific_midnight(now);
}

bool QuotaTracker::detect_sync_anomaly(TimePoint now) const {
    if (can_spend(1)) {
        return false;
    }
    if (stale_sync_) {
        return true;
    }
    return now - last_reset_boundary(now) < settings_.anomaly_window;
}

bool QuotaTracker::sync_due(TimePoint now) const {
    if (!state_.last_sync) return true;
    if (now - *state_.last_sync >= settings_.sync_interval) return true;
    return *state_.last_sync < last_reset_boundary(now);
}

bool QuotaTracker::needs_resync(TimePoint now) const {
    return sync_due(now) || detect_sync_anomaly(now);
}

void QuotaTracker::mark_limit_alert_sent(TimePoint now) {
    state_.alert_sent = true;
    state_.last_update = now;
    persist();
}

int QuotaTracker::remaining_budget() const {
    int budget = settings_.daily_ceiling - state_.calls_used;
    if (state_.api_remaining) {
        budget = std::min(budget, *state_.api_remaining);
    }
    return std::max(0, budget);
}

std::chrono::seconds QuotaTracker::time_until_reset(TimePoint now) const {
    TimePoint reset = state_.reset_time_utc && *state_.reset_time_utc > now
        ? *state_.reset_time_utc
        : provider_day::next_pacific_midnight(now);
    return std::chrono::duration_cast<std::chrono::seconds>(reset - now);
}

bool QuotaTracker::persist() const {
    if (settings_.state_path.empty()) return true;
    if (!StateStore::save(settings_.state_path, state_)) {
        spdlog::error("Failed to persist quota state");
        return false;
    }
    return true;
}
