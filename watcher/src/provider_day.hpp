#pragma once

#include "util.hpp"
#include <chrono>
#include <string>

// The provider's call budget resets at midnight US Pacific time, so the
// "current day" for quota purposes is the Pacific calendar date.
namespace provider_day {
    bool is_pacific_dst(TimePoint utc);
    std::chrono::seconds pacific_offset(TimePoint utc);

    // YYYY-MM-DD in US Pacific time
    std::string pacific_date(TimePoint utc);

    TimePoint last_pacific_midnight(TimePoint utc);
    TimePoint next_pacific_midnight(TimePoint utc);
}
