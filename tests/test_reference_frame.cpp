#include <catch2/catch_test_macros.hpp>
#include "../src/reference_frame.hpp"
#include <stdexcept>

TEST_CASE("Reference frame", "[frame]") {
    SECTION("Bull frame maps origin to 0 and pivot to 1") {
        ReferenceFrame frame(100.0, 200.0);

        REQUIRE(frame.ratio(100.0) == 0.0);
        REQUIRE(frame.ratio(200.0) == 1.0);
        REQUIRE(frame.ratio(150.0) == 0.5);
        REQUIRE(frame.price(0.5) == 150.0);
        REQUIRE(frame.price(2.0) == 300.0);
        REQUIRE(frame.range() == 100.0);
    }

    SECTION("Bear frame uses the same formula") {
        ReferenceFrame frame(200.0, 100.0);

        REQUIRE(frame.ratio(150.0) == 0.5);
        REQUIRE(frame.price(2.0) == 0.0);
        REQUIRE(frame.is_violated(210.0));
        REQUIRE_FALSE(frame.is_violated(190.0));
    }

    SECTION("Violation honours tolerance") {
        ReferenceFrame frame(100.0, 200.0);

        REQUIRE_FALSE(frame.is_violated(100.0));
        REQUIRE(frame.is_violated(99.0));
        REQUIRE_FALSE(frame.is_violated(95.0, 0.1));
        REQUIRE(frame.is_violated(85.0, 0.1));
    }

    SECTION("Coincident anchors are rejected") {
        REQUIRE_THROWS_AS(ReferenceFrame(100.0, 100.0), std::invalid_argument);
    }
}
