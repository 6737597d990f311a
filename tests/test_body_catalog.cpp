/// @file test_body_catalog.cpp
/// @brief Body table and focus levels.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "solar/body_catalog.hpp"

using namespace orrery;
using namespace orrery::solar;

TEST_CASE("Table order matches the enumeration")
{
    const auto bodies = BodyCatalog::all();
    REQUIRE(bodies.size() == 9);
    for (std::size_t i = 0; i < bodies.size(); ++i)
    {
        CHECK(index_of(bodies[i].id) == i);
    }
    CHECK(bodies.front().name == "Sun");
    CHECK(bodies.back().name == "Neptune");
}

TEST_CASE("Horizons commands: 10 for the Sun, n99 for planets")
{
    CHECK(BodyCatalog::get(BodyId::Sun).horizons_command == "10");
    CHECK(BodyCatalog::get(BodyId::Mercury).horizons_command == "199");
    CHECK(BodyCatalog::get(BodyId::Earth).horizons_command == "399");
    CHECK(BodyCatalog::get(BodyId::Neptune).horizons_command == "899");
}

TEST_CASE("Only the Sun lacks an orbit radius; orbits grow outward")
{
    CHECK_FALSE(BodyCatalog::get(BodyId::Sun).orbit_au.has_value());

    f64 previous = 0.0;
    for (const auto& body : BodyCatalog::all())
    {
        if (body.id == BodyId::Sun)
        {
            continue;
        }
        REQUIRE(body.orbit_au.has_value());
        CHECK(*body.orbit_au > previous);
        previous = *body.orbit_au;
    }
}

TEST_CASE("Name lookup is case-insensitive")
{
    CHECK(BodyCatalog::find_by_name("Mars") == BodyId::Mars);
    CHECK(BodyCatalog::find_by_name("jUPITER") == BodyId::Jupiter);
    CHECK_FALSE(BodyCatalog::find_by_name("Pluto").has_value());
    CHECK_FALSE(BodyCatalog::find_by_name("").has_value());
}

TEST_CASE("Focus levels run Earth → Neptune and clamp on lookup")
{
    const auto levels = BodyCatalog::focus_levels();
    REQUIRE(levels.size() == 6);
    CHECK(levels.front().name == "Earth");
    CHECK(levels.front().orbit_au == doctest::Approx(1.0));
    CHECK(levels[1].orbit_au == doctest::Approx(1.523679));
    CHECK(levels[2].orbit_au == doctest::Approx(5.2038));
    CHECK(levels[3].orbit_au == doctest::Approx(9.53707));
    CHECK(levels[4].orbit_au == doctest::Approx(19.19126));
    CHECK(levels.back().orbit_au == doctest::Approx(30.06896));

    CHECK(BodyCatalog::outermost_focus_index() == 5);
    CHECK(BodyCatalog::focus_level(99).name == "Neptune");
}

TEST_CASE("Focus radii match the body table")
{
    for (const auto& level : BodyCatalog::focus_levels())
    {
        const auto id = BodyCatalog::find_by_name(level.name);
        REQUIRE(id.has_value());
        CHECK(*BodyCatalog::get(*id).orbit_au == doctest::Approx(level.orbit_au));
    }
}

TEST_CASE("Icon style selects the glyph set")
{
    const auto& earth = BodyCatalog::get(BodyId::Earth);
    CHECK(BodyCatalog::icon(earth, IconStyle::Unicode) == "♁");
    CHECK(BodyCatalog::icon(earth, IconStyle::NerdFont) == earth.nerd_icon);
    CHECK(BodyCatalog::icon(BodyCatalog::get(BodyId::Sun), IconStyle::Unicode) == "☉");
}
