#pragma once

/// @file ephemeris_source.hpp
/// @brief Interface for anything that can resolve a body to a heliocentric vector.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "solar/body_catalog.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace orrery::ephemeris
{
    enum class FetchErrorKind : u8
    {
        Network,        ///< Transport failure (DNS, TLS, timeout, ...)
        HttpStatus,     ///< Non-2xx response
        MalformedJson,  ///< Body is not the expected JSON envelope
        ServiceError,   ///< Envelope carries an "error" field
        MissingMarkers, ///< $$SOE / $$EOE not found or out of order
        UnparseableRow, ///< No table row yielded three numeric columns
    };

    /// @brief Per-body failure, reported as a value rather than thrown.
    struct FetchError
    {
        FetchErrorKind kind;
        std::string detail;
    };

    /// @brief Position in AU (heliocentric, ecliptic) or the reason there is none.
    using FetchResult = std::variant<Vec3d, FetchError>;

    [[nodiscard]] std::string_view to_string(FetchErrorKind kind);

    /// @brief Source of body positions for one time window.
    ///
    /// Implementations own all network and parsing failure handling and must
    /// not throw; every failure comes back as a FetchError.
    class EphemerisSource
    {
    public:
        virtual ~EphemerisSource() = default;

        [[nodiscard]] virtual FetchResult fetch_position(const solar::BodyInfo& body,
                                                         const astro::TimeWindow& window) = 0;
    };

} // namespace orrery::ephemeris
