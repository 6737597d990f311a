/// @file test_projection.cpp
/// @brief Unit tests for orrery::rendering::Projection.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "rendering/projection.hpp"
#include "solar/body_catalog.hpp"

#include <cmath>
#include <cstdlib>

using namespace orrery;
using namespace orrery::rendering;

// =================================================================
// Scale
// =================================================================

TEST_CASE("Scale fits the focus orbit to 45% of the short side")
{
    // 80x24 grid, focus Earth (1 AU), zoom 1 → 24 × 0.45 = 10.8 cells/AU
    CHECK(Projection::compute_scale(80, 24, 1.0, 1.0) == doctest::Approx(10.8));

    // Width is the short side here
    CHECK(Projection::compute_scale(20, 100, 2.0, 1.0) == doctest::Approx(4.5));
}

TEST_CASE("Tiny focus radii are floored at 0.1 AU")
{
    CHECK(Projection::compute_scale(40, 40, 0.0, 1.0)
          == doctest::Approx(Projection::compute_scale(40, 40, 0.1, 1.0)));
    CHECK(Projection::compute_scale(40, 40, 0.01, 1.0) == doctest::Approx(180.0));
}

TEST_CASE("Zero-sized grids still give a positive scale")
{
    CHECK(Projection::compute_scale(0, 0, 30.06896, 1.0) > 0.0);
    CHECK(Projection::compute_scale(-5, 10, 1.0, 1.0) > 0.0);
}

TEST_CASE("Scale is positive for every focus level and increases with zoom")
{
    for (const auto& level : solar::BodyCatalog::focus_levels())
    {
        f64 previous = 0.0;
        for (const f64 zoom : {0.2, 0.5, 1.0, 1.25, 10.0, 50.0})
        {
            const f64 scale = Projection::compute_scale(120, 40, level.orbit_au, zoom);
            CHECK(scale > 0.0);
            CHECK(scale > previous);
            previous = scale;
        }
    }
}

// =================================================================
// Screen mapping
// =================================================================

TEST_CASE("Center uses integer division")
{
    CHECK(Projection(80, 24, 1.0, 1.0).center() == Vec2i{40, 12});
    CHECK(Projection(7, 5, 1.0, 1.0).center() == Vec2i{3, 2});
    CHECK(Projection(0, 0, 1.0, 1.0).center() == Vec2i{0, 0});
}

TEST_CASE("The origin projects to the center")
{
    const Projection projection(61, 33, 5.2038, 3.0);
    CHECK(projection.to_screen(Vec3d{0.0}) == projection.center());
}

TEST_CASE("Positive Y goes up the screen, Z is ignored")
{
    const Projection projection(80, 24, 1.0, 1.0);

    // 0.5 AU × 10.8 = 5.4 → 5 cells
    CHECK(projection.to_screen(Vec3d{0.0, 0.5, 0.0}) == Vec2i{40, 7});
    CHECK(projection.to_screen(Vec3d{0.0, -0.5, 0.0}) == Vec2i{40, 17});
    CHECK(projection.to_screen(Vec3d{0.0, 0.5, 123.0}) == Vec2i{40, 7});
}

TEST_CASE("A body on the focus orbit lands near 0.45 × min(w,h) × zoom from center")
{
    for (const f64 zoom : {0.2, 1.0, 2.0})
    {
        const i32 w = 100;
        const i32 h = 40;
        const f64 focus = 9.53707;
        const Projection projection(w, h, focus, zoom);

        const Vec2i cell = projection.to_screen(Vec3d{focus, 0.0, 0.0});
        const auto expected_x = projection.center().x
                              + static_cast<i32>(std::lround(0.45 * 40.0 * zoom));
        CHECK(std::abs(cell.x - expected_x) <= 1);
        CHECK(cell.y == projection.center().y);
    }
}

TEST_CASE("Projection never clamps off-grid positions")
{
    const Projection projection(20, 10, 1.0, 1.0);
    const Vec2i far = projection.to_screen(Vec3d{30.0, -30.0, 0.0});
    CHECK(far.x > 20);
    CHECK(far.y > 10);
}
