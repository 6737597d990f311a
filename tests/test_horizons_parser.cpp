/// @file test_horizons_parser.cpp
/// @brief Horizons JSON envelope, $$SOE/$$EOE table and CSV row parsing.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "ephemeris/horizons_parser.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace orrery;
using namespace orrery::ephemeris;

namespace
{

// Trimmed copy of a real VECTORS / CSV_FORMAT=YES / VEC_TABLE=1 report
const std::string kMarsReport =
    "*******************************************************************************\n"
    "Ephemeris / API_USER Mon Jan  6 10:00:00 2025 Pasadena, USA      / Horizons\n"
    "*******************************************************************************\n"
    "Target body name: Mars (499)                      {source: mar097}\n"
    "Center body name: Sun (10)                        {source: DE441}\n"
    "*******************************************************************************\n"
    "            JDTDB,            Calendar Date (TDB),                      X,                      Y,                      Z,\n"
    "**************************************************************************************************************************\n"
    "$$SOE\n"
    "2460681.916666667, A.D. 2025-Jan-06 10:00:00.0000, -4.126396505469046E-01,  1.565029286738431E+00,  4.262232395236215E-02,\n"
    "2460681.917361111, A.D. 2025-Jan-06 10:01:00.0000, -4.126553226217830E-01,  1.565024795017282E+00,  4.262265633048716E-02,\n"
    "$$EOE\n"
    "**************************************************************************************************************************\n";

std::string envelope(const std::string& result)
{
    return nlohmann::json{{"signature", {{"source", "NASA/JPL Horizons API"}, {"version", "1.2"}}},
                          {"result", result}}.dump();
}

const FetchError& require_error(const FetchResult& result)
{
    REQUIRE(std::holds_alternative<FetchError>(result));
    return std::get<FetchError>(result);
}

} // anonymous namespace

// =================================================================
// Full pipeline
// =================================================================

TEST_CASE("First table row yields the position")
{
    const FetchResult result = HorizonsParser::parse_response(envelope(kMarsReport), "499");
    REQUIRE(std::holds_alternative<Vec3d>(result));

    const Vec3d p = std::get<Vec3d>(result);
    CHECK(p.x == doctest::Approx(-0.4126396505469046));
    CHECK(p.y == doctest::Approx(1.565029286738431));
    CHECK(p.z == doctest::Approx(0.04262232395236215));
}

TEST_CASE("Service error field is reported verbatim")
{
    const std::string body = R"({"error":"No ephemeris for target \"Vulcan\""})";
    const auto& error = require_error(HorizonsParser::parse_response(body, "Vulcan"));
    CHECK(error.kind == FetchErrorKind::ServiceError);
    CHECK(error.detail == "Horizons error: No ephemeris for target \"Vulcan\"");
}

TEST_CASE("Null error field is ignored")
{
    const std::string body = nlohmann::json{{"error", nullptr}, {"result", kMarsReport}}.dump();
    CHECK(std::holds_alternative<Vec3d>(HorizonsParser::parse_response(body, "499")));
}

TEST_CASE("Invalid JSON is a malformed-json failure")
{
    const auto& error = require_error(HorizonsParser::parse_response("<html>502</html>", "499"));
    CHECK(error.kind == FetchErrorKind::MalformedJson);
}

TEST_CASE("Non-string result is a malformed-json failure")
{
    const auto& error = require_error(HorizonsParser::parse_response(R"({"result": 42})", "499"));
    CHECK(error.kind == FetchErrorKind::MalformedJson);
}

TEST_CASE("Missing result is treated as an empty report")
{
    const auto& error = require_error(HorizonsParser::parse_response("{}", "499"));
    CHECK(error.kind == FetchErrorKind::MissingMarkers);
    CHECK(error.detail == "Missing $$SOE marker");
}

TEST_CASE("Table without a numeric row names the body")
{
    const std::string report = "$$SOE\nno data here\n, , , , ,\n$$EOE\n";
    const auto& error = require_error(HorizonsParser::parse_response(envelope(report), "799"));
    CHECK(error.kind == FetchErrorKind::UnparseableRow);
    CHECK(error.detail == "No parseable vector row for body 799");
}

TEST_CASE("Unparseable rows are skipped in favor of a later good one")
{
    const std::string report =
        "$$SOE\n"
        "garbage, row, x, y, z,\n"
        "2460000.5, A.D. 2023-Feb-24 00:00:00.0000, 1.0E+00, 2.0E+00, 3.0E+00,\n"
        "$$EOE\n";
    const FetchResult result = HorizonsParser::parse_response(envelope(report), "399");
    REQUIRE(std::holds_alternative<Vec3d>(result));
    CHECK(std::get<Vec3d>(result) == Vec3d{1.0, 2.0, 3.0});
}

// =================================================================
// Markers
// =================================================================

TEST_CASE("Marker errors")
{
    SUBCASE("no start marker")
    {
        const auto table = HorizonsParser::extract_table_lines("x\n$$EOE\n");
        REQUIRE(std::holds_alternative<FetchError>(table));
        CHECK(std::get<FetchError>(table).detail == "Missing $$SOE marker");
    }

    SUBCASE("no end marker")
    {
        const auto table = HorizonsParser::extract_table_lines("$$SOE\n1,2,3,4,5\n");
        REQUIRE(std::holds_alternative<FetchError>(table));
        CHECK(std::get<FetchError>(table).detail == "Missing $$EOE marker");
    }

    SUBCASE("end before start")
    {
        const auto table = HorizonsParser::extract_table_lines("$$EOE\n$$SOE\n");
        REQUIRE(std::holds_alternative<FetchError>(table));
        CHECK(std::get<FetchError>(table).kind == FetchErrorKind::MissingMarkers);
        CHECK(std::get<FetchError>(table).detail == "$$EOE occurs before $$SOE");
    }
}

TEST_CASE("Table lines are trimmed and blank lines dropped")
{
    const auto table = HorizonsParser::extract_table_lines("head\n$$SOE\r\n  a, b  \r\n\n   \nc\n$$EOE tail");
    REQUIRE(std::holds_alternative<TableLines>(table));

    const auto& lines = std::get<TableLines>(table);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "a, b");
    CHECK(lines[1] == "c");
}

// =================================================================
// Rows
// =================================================================

TEST_CASE("Row parsing takes the last three non-empty columns")
{
    const auto xyz = HorizonsParser::parse_xyz_row(
        "2460681.9, A.D. 2025-Jan-06 10:00:00.0000, +1.5E-01, -2.25, 3,");
    REQUIRE(xyz.has_value());
    CHECK(*xyz == Vec3d{0.15, -2.25, 3.0});
}

TEST_CASE("Rows with fewer than five columns are rejected")
{
    CHECK_FALSE(HorizonsParser::parse_xyz_row("1.0, 2.0, 3.0, 4.0").has_value());
    CHECK(HorizonsParser::parse_xyz_row("a, b, 1.0, 2.0, 3.0").has_value());
}

TEST_CASE("Rows with a non-numeric coordinate are rejected")
{
    CHECK_FALSE(HorizonsParser::parse_xyz_row("a, b, 1.0, n/a, 3.0,").has_value());
    CHECK_FALSE(HorizonsParser::parse_xyz_row("a, b, 1.0, 2.0x, 3.0,").has_value());
    CHECK_FALSE(HorizonsParser::parse_xyz_row("a, b, 1.0, +, 3.0,").has_value());
}
