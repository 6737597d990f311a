/// @file test_text.cpp
/// @brief UTF-8 column counting, truncation and padding.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/text.hpp"

using namespace orrery::core;

TEST_CASE("Columns count code points")
{
    CHECK(utf8_columns("") == 0);
    CHECK(utf8_columns("Mars") == 4);
    CHECK(utf8_columns("—") == 1);
    CHECK(utf8_columns("☉ Sun") == 5);
    CHECK(utf8_columns("Starting…") == 9);
}

TEST_CASE("Truncation never splits a code point")
{
    CHECK(utf8_truncate("Neptune", 3) == "Nep");
    CHECK(utf8_truncate("a—b", 2) == "a—");
    CHECK(utf8_truncate("♁♂", 1) == "♁");
    CHECK(utf8_truncate("short", 10) == "short");
    CHECK(utf8_truncate("anything", 0).empty());
    CHECK(utf8_truncate("anything", -4).empty());
}

TEST_CASE("Padding fills with spaces to the exact width")
{
    CHECK(utf8_pad("X", 4) == "X   ");
    CHECK(utf8_pad("—", 3) == "—  ");
    CHECK(utf8_pad("Jupiter", 3) == "Jup");
    CHECK(utf8_pad("", 2) == "  ");
    CHECK(utf8_columns(utf8_pad("☉", 14)) == 14);
}
