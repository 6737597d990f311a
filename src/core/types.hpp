#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace orrery
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using i16 = int16_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for ephemeris data)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Integer cell coordinates on a character grid
    using Vec2i = glm::ivec2;

    /// @brief Screen rectangle in character cells (column x, row y).
    struct Rect
    {
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;
    };

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd = 2440587.5;  // 1970-01-01 00:00 UTC
        constexpr f64 kSecondsPerDay = 86400.0;
    }
}
