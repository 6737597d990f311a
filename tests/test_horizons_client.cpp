/// @file test_horizons_client.cpp
/// @brief Horizons query construction. No network access.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "ephemeris/horizons_client.hpp"

#include <string>

using namespace orrery;
using namespace orrery::ephemeris;

int main(int argc, char** argv)
{
    core::Logger::init(core::LoggerConfig{.file_path = "test_horizons_client.log", .console = false});

    int result = 0;
    {
        CurlGlobal curl;
        doctest::Context context;
        context.applyCommandLine(argc, argv);
        result = context.run();
    }

    core::Logger::shutdown();
    return result;
}

namespace
{

const astro::TimeWindow kWindow{.start = "2025-Jan-06 10:00:00", .stop = "2025-Jan-06 10:01:00"};

} // anonymous namespace

TEST_CASE("Query URL starts with the base URL and lists parameters in order")
{
    const HorizonsClient client;
    const std::string url = client.build_query_url("499", kWindow);

    CHECK(url.rfind("https://ssd.jpl.nasa.gov/api/horizons.api?format=json&", 0) == 0);

    const auto command = url.find("&COMMAND=499&");
    const auto center = url.find("&CENTER=500%4010&");
    const auto start = url.find("&START_TIME=");
    const auto step = url.find("&STEP_SIZE=");
    REQUIRE(command != std::string::npos);
    REQUIRE(center != std::string::npos);
    REQUIRE(start != std::string::npos);
    REQUIRE(step != std::string::npos);
    CHECK(command < center);
    CHECK(center < start);
    CHECK(start < step);
}

TEST_CASE("Vector table options: ecliptic, AU-D, CSV, position only")
{
    const HorizonsClient client;
    const std::string url = client.build_query_url("399", kWindow);

    CHECK(url.find("&EPHEM_TYPE=VECTORS") != std::string::npos);
    CHECK(url.find("&REF_PLANE=ECLIPTIC") != std::string::npos);
    CHECK(url.find("&REF_SYSTEM=ICRF") != std::string::npos);
    CHECK(url.find("&OUT_UNITS=AU-D") != std::string::npos);
    CHECK(url.find("&CSV_FORMAT=YES") != std::string::npos);
    CHECK(url.find("&VEC_TABLE=1") != std::string::npos);
    CHECK(url.find("&OBJ_DATA=NO") != std::string::npos);
}

TEST_CASE("Quoted times and step size are percent-encoded")
{
    const HorizonsClient client;
    const std::string url = client.build_query_url("199", kWindow);

    CHECK(url.find("&START_TIME=%272025-Jan-06%2010%3A00%3A00%27") != std::string::npos);
    CHECK(url.find("&STOP_TIME=%272025-Jan-06%2010%3A01%3A00%27") != std::string::npos);
    CHECK(url.find("&STEP_SIZE=%271%20m%27") != std::string::npos);
    CHECK(url.find(' ') == std::string::npos);
}

TEST_CASE("Configured base URL is used")
{
    HorizonsConfig config;
    config.base_url = "http://localhost:8080/horizons";
    const HorizonsClient client(config);

    CHECK(client.build_query_url("10", kWindow).rfind("http://localhost:8080/horizons?format=json", 0) == 0);
}
