/**
 * @file test_wind.cpp
 * @brief Tests for wind vector decomposition.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tempest/wind.hpp>

using namespace tempest;
using Catch::Matchers::WithinAbs;

TEST_CASE("Wind keeps speed and direction as given", "[wind]") {
    Wind wind(4.5, 270.0);
    REQUIRE(wind.speed_magnitude() == 4.5);
    REQUIRE(wind.source_direction() == 270.0);

    SECTION("direction outside 0-360 is not normalized") {
        Wind odd(1.0, 450.0);
        REQUIRE(odd.source_direction() == 450.0);
    }
}

TEST_CASE("Wind component direction", "[wind]") {
    SECTION("from the north") {
        Components c = Wind(3.0, 0.0).component_direction();
        REQUIRE_THAT(c.north, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(c.east, WithinAbs(0.0, 1e-12));
    }

    SECTION("from the east") {
        Components c = Wind(3.0, 90.0).component_direction();
        REQUIRE_THAT(c.north, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(c.east, WithinAbs(1.0, 1e-12));
    }

    SECTION("from the south west") {
        Components c = Wind(3.0, 225.0).component_direction();
        REQUIRE_THAT(c.north, WithinAbs(-0.7071067811865476, 1e-12));
        REQUIRE_THAT(c.east, WithinAbs(-0.7071067811865476, 1e-12));
    }

    SECTION("unit length for any direction") {
        for (double direction = 0.0; direction < 360.0; direction += 7.5) {
            Components c = Wind(1.0, direction).component_direction();
            REQUIRE_THAT(c.north * c.north + c.east * c.east, WithinAbs(1.0, 1e-12));
        }
    }
}

TEST_CASE("Wind component velocity", "[wind]") {
    SECTION("scaled by speed") {
        Components v = Wind(2.0, 180.0).component_velocity();
        REQUIRE_THAT(v.north, WithinAbs(-2.0, 1e-12));
        REQUIRE_THAT(v.east, WithinAbs(0.0, 1e-12));
    }

    SECTION("calm wind has no velocity") {
        Components v = Wind(0.0, 144.0).component_velocity();
        REQUIRE(v.north == 0.0);
        REQUIRE(v.east == 0.0);
    }
}
