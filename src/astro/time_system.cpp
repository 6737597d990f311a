/// @file time_system.cpp
/// @brief Implementation of Julian Date conversion and timestamp formatting.

#include "astro/time_system.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <chrono>
#include <cmath>

namespace orrery::astro
{

namespace
{

constexpr std::array<const char*, 12> kMonthAbbrev = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

} // anonymous namespace

// -----------------------------------------------------------------
// Julian Date (Meeus Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb count as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // JD days start at noon; shift to midnight
    const f64 shifted = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(shifted));
    const f64 f = shifted - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 seconds_of_day = (day_with_fraction - static_cast<f64>(day))
                             * astro_constants::kSecondsPerDay;

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year  = (month > 2) ? (c - 4716) : (c - 4715);

    const i32 hour   = static_cast<i32>(seconds_of_day / 3600.0);
    const i32 minute = static_cast<i32>((seconds_of_day - hour * 3600.0) / 60.0);
    const f64 second = seconds_of_day - hour * 3600.0 - minute * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// System clock → Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const f64 total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    return astro_constants::kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------

DateTime TimeSystem::to_whole_seconds(f64 jd)
{
    // Whole seconds counted from the midnight that starts JD day 0
    const i64 total = std::llround((jd + 0.5) * astro_constants::kSecondsPerDay);
    const i64 per_day = static_cast<i64>(astro_constants::kSecondsPerDay);
    const i64 day_number = total / per_day;
    const i64 second_of_day = total % per_day;

    // JD == day_number is noon of the wanted civil day
    DateTime dt = from_julian_date(static_cast<f64>(day_number));
    dt.hour   = static_cast<i32>(second_of_day / 3600);
    dt.minute = static_cast<i32>((second_of_day % 3600) / 60);
    dt.second = static_cast<f64>(second_of_day % 60);
    return dt;
}

std::string TimeSystem::format_horizons(f64 jd)
{
    const DateTime dt = to_whole_seconds(jd);
    return fmt::format("{:04d}-{}-{:02d} {:02d}:{:02d}:{:02d}",
                       dt.year, kMonthAbbrev[static_cast<std::size_t>(dt.month - 1)], dt.day,
                       dt.hour, dt.minute, static_cast<i32>(dt.second));
}

std::string TimeSystem::format_iso8601(f64 jd)
{
    const DateTime dt = to_whole_seconds(jd);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       dt.year, dt.month, dt.day,
                       dt.hour, dt.minute, static_cast<i32>(dt.second));
}

TimeWindow TimeSystem::window_from(f64 jd, i32 minutes)
{
    const f64 stop_jd = jd + static_cast<f64>(minutes) * 60.0 / astro_constants::kSecondsPerDay;
    return TimeWindow{
        .start = format_horizons(jd),
        .stop  = format_horizons(stop_jd),
    };
}

} // namespace orrery::astro
