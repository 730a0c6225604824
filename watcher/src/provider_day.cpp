#include "provider_day.hpp"
#include <cstdio>

namespace provider_day {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// 0 = Sunday
unsigned weekday(int64_t days) {
    return static_cast<unsigned>(((days % 7) + 11) % 7);
}

int64_t nth_sunday(int year, unsigned month, unsigned n) {
    int64_t first = util::days_from_civil(year, month, 1);
    unsigned wd = weekday(first);
    int64_t first_sunday = first + (wd == 0 ? 0 : 7 - wd);
    return first_sunday + 7 * (n - 1);
}

int64_t local_day_index(TimePoint utc) {
    int64_t local = util::to_epoch_seconds(utc) + pacific_offset(utc).count();
    return floor_div(local, kSecondsPerDay);
}

// Local midnight of the given day index expressed in UTC. The offset in force
// at midnight can differ from the one "now" on transition days.
TimePoint midnight_utc(int64_t day_index, std::chrono::seconds guess_offset) {
    int64_t local_midnight = day_index * kSecondsPerDay;
    TimePoint candidate = util::from_epoch_seconds(local_midnight - guess_offset.count());
    return util::from_epoch_seconds(local_midnight - pacific_offset(candidate).count());
}

} // namespace

bool is_pacific_dst(TimePoint utc) {
    int64_t secs = util::to_epoch_seconds(utc);
    int year;
    unsigned month, day;
    util::civil_from_days(floor_div(secs, kSecondsPerDay), year, month, day);

    // Second Sunday of March 02:00 PST through first Sunday of November 02:00 PDT
    int64_t start = nth_sunday(year, 3, 2) * kSecondsPerDay + 10 * 3600;
    int64_t end = nth_sunday(year, 11, 1) * kSecondsPerDay + 9 * 3600;
    return secs >= start && secs < end;
}

std::chrono::seconds pacific_offset(TimePoint utc) {
    return std::chrono::hours(is_pacific_dst(utc) ? -7 : -8);
}

std::string pacific_date(TimePoint utc) {
    int year;
    unsigned month, day;
    util::civil_from_days(local_day_index(utc), year, month, day);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

TimePoint last_pacific_midnight(TimePoint utc) {
    return midnight_utc(local_day_index(utc), pacific_offset(utc));
}

TimePoint next_pacific_midnight(TimePoint utc) {
    return midnight_utc(local_day_index(utc) + 1, pacific_offset(utc));
}

} // namespace provider_day
