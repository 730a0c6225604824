#pragma once

#include "quota_tracker.hpp"
#include "util.hpp"
#include <chrono>

struct PacingSettings {
    bool smart = true;
    std::chrono::seconds fixed_interval{300};
    std::chrono::seconds min_interval{30};
    std::chrono::seconds max_interval{900};
    std::chrono::seconds min_wait{300};       // bounds when the budget is spent
    std::chrono::seconds max_wait{3600};
    std::chrono::seconds reset_grace{60};
    int reserve_calls = 100;
    std::chrono::seconds anomaly_retry{120};
    std::chrono::seconds backoff_base{60};
    std::chrono::seconds max_backoff{900};
};

// Spreads the remaining budget evenly until the next reset
std::chrono::seconds next_cycle_interval(const QuotaTracker& quota,
                                         int enabled_specs,
                                         TimePoint now,
                                         const PacingSettings& settings);

// Delay after consecutive cycles in which every search failed
std::chrono::seconds failure_backoff(int consecutive_failures, const PacingSettings& settings);
