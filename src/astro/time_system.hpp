#pragma once

/// @file time_system.hpp
/// @brief Time utilities: Julian Date conversion and ephemeris query timestamps.

#include "core/types.hpp"

#include <string>

namespace orrery::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Start/stop pair for a Horizons vector table request.
    struct TimeWindow
    {
        std::string start;  ///< e.g. "2024-Jan-05 07:03:09"
        std::string stop;
    };

    /// @brief Static utility class for time computations.
    ///
    /// Julian Date conversion follows Meeus, Astronomical Algorithms Ch. 7.
    /// Formatting helpers produce the two string forms the program needs:
    /// the Horizons calendar form used in query windows, and an ISO-8601
    /// label shown as the last-update timestamp.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Format as Horizons calendar time: "YYYY-Mon-DD HH:MM:SS".
        [[nodiscard]] static std::string format_horizons(f64 jd);

        /// @brief Format as ISO-8601 UTC with seconds precision: "YYYY-MM-DDTHH:MM:SSZ".
        [[nodiscard]] static std::string format_iso8601(f64 jd);

        /// @brief Query window starting at @p jd and spanning @p minutes.
        [[nodiscard]] static TimeWindow window_from(f64 jd, i32 minutes = 1);

    private:
        /// @brief Convert to civil time rounded to the nearest whole second.
        [[nodiscard]] static DateTime to_whole_seconds(f64 jd);
    };

} // namespace orrery::astro
