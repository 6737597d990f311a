/// @file horizons_client.cpp
/// @brief HorizonsClient implementation over the libcurl easy interface.

#include "ephemeris/horizons_client.hpp"

#include "core/logger.hpp"
#include "ephemeris/horizons_parser.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <utility>

namespace orrery::ephemeris
{

namespace
{

size_t append_to_string(char* data, size_t size, size_t count, void* user)
{
    auto* out = static_cast<std::string*>(user);
    out->append(data, size * count);
    return size * count;
}

} // anonymous namespace

// =================================================================
// CurlGlobal
// =================================================================

CurlGlobal::CurlGlobal()
{
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    m_ok = (rc == CURLE_OK);
    if (!m_ok)
    {
        ORR_CORE_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal()
{
    if (m_ok)
    {
        curl_global_cleanup();
    }
}

// =================================================================
// HorizonsClient
// =================================================================

HorizonsClient::HorizonsClient(HorizonsConfig config)
    : m_config(std::move(config))
    , m_curl(curl_easy_init())
{
    if (!m_curl)
    {
        ORR_CORE_ERROR("HorizonsClient: curl_easy_init failed; every fetch will fail");
        return;
    }
    ORR_CORE_INFO("HorizonsClient ready: {}", m_config.base_url);
}

HorizonsClient::~HorizonsClient() = default;

std::string HorizonsClient::escape(std::string_view value) const
{
    char* encoded = curl_easy_escape(m_curl.get(), value.data(), static_cast<int>(value.size()));
    if (encoded == nullptr)
    {
        return std::string(value);
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

// -----------------------------------------------------------------
// Query: heliocentric (500@10) ecliptic vectors in AU, CSV table,
// position-only (VEC_TABLE=1), one-minute step over the window
// -----------------------------------------------------------------

std::string HorizonsClient::build_query_url(std::string_view command,
                                            const astro::TimeWindow& window) const
{
    const std::string start = fmt::format("'{}'", window.start);
    const std::string stop  = fmt::format("'{}'", window.stop);

    const std::array<std::pair<std::string_view, std::string_view>, 15> params = {{
        {"format",      "json"},
        {"MAKE_EPHEM",  "YES"},
        {"OBJ_DATA",    "NO"},
        {"EPHEM_TYPE",  "VECTORS"},
        {"COMMAND",     command},
        {"CENTER",      "500@10"},
        {"REF_PLANE",   "ECLIPTIC"},
        {"REF_SYSTEM",  "ICRF"},
        {"OUT_UNITS",   "AU-D"},
        {"CSV_FORMAT",  "YES"},
        {"VEC_TABLE",   "1"},
        {"TIME_TYPE",   "UT"},
        {"START_TIME",  start},
        {"STOP_TIME",   stop},
        {"STEP_SIZE",   "'1 m'"},
    }};

    std::string url = m_config.base_url;
    char separator = '?';
    for (const auto& [key, value] : params)
    {
        url += separator;
        url += key;
        url += '=';
        url += escape(value);
        separator = '&';
    }
    return url;
}

FetchResult HorizonsClient::fetch_position(const solar::BodyInfo& body,
                                           const astro::TimeWindow& window)
{
    if (!m_curl)
    {
        return FetchError{FetchErrorKind::Network, "HTTP client unavailable"};
    }

    CURL* curl = m_curl.get();
    const std::string url = build_query_url(body.horizons_command, window);

    std::string response;
    std::array<char, CURL_ERROR_SIZE> error_buffer{};

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_config.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(m_config.connect_timeout.count()));

    ORR_CORE_TRACE("GET {}", url);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK)
    {
        const std::string detail = (error_buffer[0] != '\0')
            ? std::string(error_buffer.data())
            : std::string(curl_easy_strerror(rc));
        return FetchError{FetchErrorKind::Network, detail};
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
    {
        return FetchError{FetchErrorKind::HttpStatus,
                          fmt::format("HTTP status {} for {}", status, url)};
    }

    ORR_CORE_DEBUG("{}: {} bytes from Horizons", body.name, response.size());
    return HorizonsParser::parse_response(response, body.horizons_command);
}

} // namespace orrery::ephemeris
