#include "pacing.hpp"
#include <algorithm>

std::chrono::seconds next_cycle_interval(const QuotaTracker& quota,
                                         int enabled_specs,
                                         TimePoint now,
                                         const PacingSettings& settings) {
    if (!settings.smart) {
        return settings.fixed_interval;
    }

    const int specs = std::max(1, enabled_specs);
    const int budget = quota.remaining_budget() - settings.reserve_calls;
    const auto until_reset = quota.time_until_reset(now);

    if (budget < specs) {
        auto wait = until_reset + settings.reset_grace;
        return std::clamp(wait, settings.min_wait, settings.max_wait);
    }

    const int cycles_left = budget / specs;
    auto interval = std::chrono::seconds(until_reset.count() / cycles_left);
    return std::clamp(interval, settings.min_interval, settings.max_interval);
}

std::chrono::seconds failure_backoff(int consecutive_failures, const PacingSettings& settings) {
    if (consecutive_failures <= 0) {
        return std::chrono::seconds(0);
    }
    // Cap the exponent well before it could overflow
    int exponent = std::min(consecutive_failures - 1, 16);
    auto delay = settings.backoff_base * (1 << exponent);
    return std::min(delay, settings.max_backoff);
}
