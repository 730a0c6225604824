#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Blocking delay used by retry loops and the inter-cycle sleep. Tests swap in
// a recorder so backoff never actually waits.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

namespace util {
    std::string to_iso8601(TimePoint tp);
    std::optional<TimePoint> parse_iso8601(const std::string& str);

    int64_t to_epoch_seconds(TimePoint tp);
    TimePoint from_epoch_seconds(int64_t secs);

    // Proleptic Gregorian conversions, days counted from 1970-01-01.
    int64_t days_from_civil(int year, unsigned month, unsigned day);
    void civil_from_days(int64_t days, int& year, unsigned& month, unsigned& day);

    std::string to_lower(const std::string& str);
    std::string trim(const std::string& str);
    std::string base64_encode(const std::string& input);

    Sleeper real_sleeper();
}
