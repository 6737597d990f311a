#pragma once

/// @file horizons_client.hpp
/// @brief libcurl-backed client for the JPL Horizons vector API.

#include "ephemeris/ephemeris_source.hpp"

#include <curl/curl.h>

#include <chrono>
#include <memory>
#include <string>

namespace orrery::ephemeris
{
    /// @brief Connection and query settings for HorizonsClient.
    struct HorizonsConfig
    {
        std::string base_url = "https://ssd.jpl.nasa.gov/api/horizons.api";
        std::string user_agent = "orrery/0.5 (curses)";
        std::chrono::seconds timeout{20};
        std::chrono::seconds connect_timeout{10};
    };

    /// @brief Process-wide libcurl initialization. Create one in main() before any client.
    class CurlGlobal
    {
    public:
        CurlGlobal();
        ~CurlGlobal();

        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;

        [[nodiscard]] bool ok() const { return m_ok; }

    private:
        bool m_ok = false;
    };

    /// @brief Fetches heliocentric ecliptic vectors (AU) from Horizons, one body per request.
    ///
    /// Owns a single easy handle, so one instance must not be used from two
    /// threads at once. The updater thread is its only caller.
    class HorizonsClient final : public EphemerisSource
    {
    public:
        explicit HorizonsClient(HorizonsConfig config = {});
        ~HorizonsClient() override;

        HorizonsClient(const HorizonsClient&) = delete;
        HorizonsClient& operator=(const HorizonsClient&) = delete;

        [[nodiscard]] FetchResult fetch_position(const solar::BodyInfo& body,
                                                 const astro::TimeWindow& window) override;

        /// @brief Full GET URL for a one-minute vector table of @p command.
        [[nodiscard]] std::string build_query_url(std::string_view command,
                                                  const astro::TimeWindow& window) const;

    private:
        struct CurlDeleter
        {
            void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
        };

        /// @brief Percent-encode a query value.
        [[nodiscard]] std::string escape(std::string_view value) const;

        HorizonsConfig m_config;
        std::unique_ptr<CURL, CurlDeleter> m_curl;
    };

} // namespace orrery::ephemeris
