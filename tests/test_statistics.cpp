#include <catch2/catch_test_macros.hpp>
#include "../src/range_distribution.hpp"
#include "../src/impulse.hpp"
#include "../src/errors.hpp"

TEST_CASE("Range distribution", "[statistics]") {
    RangeDistribution dist;
    for (int i = 10; i >= 1; i--) {
        dist.insert(static_cast<double>(i));
    }

    SECTION("Values stay sorted") {
        REQUIRE(dist.size() == 10);
        REQUIRE(dist.values().front() == 1.0);
        REQUIRE(dist.values().back() == 10.0);
    }

    SECTION("Percentile rank counts values strictly below") {
        REQUIRE(dist.percentile_rank(5.0) == 40.0);
        REQUIRE(dist.percentile_rank(0.5) == 0.0);
        REQUIRE(dist.percentile_rank(11.0) == 100.0);
    }

    SECTION("Top fraction cutoff") {
        REQUIRE(dist.top_fraction_cutoff(0.1) == 10.0);
        REQUIRE(dist.top_fraction_cutoff(0.3) == 8.0);
        REQUIRE(dist.in_top_fraction(10.0, 0.1));
        REQUIRE_FALSE(dist.in_top_fraction(9.0, 0.1));
        REQUIRE_FALSE(dist.in_top_fraction(10.0, 0.0));
    }

    SECTION("Replace and erase") {
        dist.replace(3.0, 30.0);
        REQUIRE(dist.values().back() == 30.0);
        REQUIRE_THROWS_AS(dist.erase(3.0), InvariantError);
    }

    SECTION("Empty distribution classifies nothing as top") {
        RangeDistribution empty;
        REQUIRE_FALSE(empty.in_top_fraction(1.0, 0.1));
        REQUIRE(empty.percentile_rank(1.0) == 0.0);
    }
}

TEST_CASE("Impulse statistics", "[statistics]") {
    SECTION("Spikiness needs three samples") {
        ImpulseMoments m;
        m.add(1.0);
        m.add(2.0);
        REQUIRE_FALSE(m.spikiness().has_value());
    }

    SECTION("Uniform contributions are neutral") {
        ImpulseMoments m;
        for (int i = 0; i < 5; i++) m.add(2.0);
        REQUIRE(m.spikiness().value() == 50.0);
    }

    SECTION("One large bar makes a spiky leg") {
        ImpulseMoments m;
        m.add(1.0);
        m.add(1.0);
        m.add(1.0);
        m.add(10.0);
        REQUIRE(m.spikiness().value() > 50.0);
    }

    SECTION("One large adverse bar skews the other way") {
        ImpulseMoments m;
        m.add(1.0);
        m.add(1.0);
        m.add(1.0);
        m.add(-10.0);
        REQUIRE(m.spikiness().value() < 50.0);
    }

    SECTION("Impulsiveness ranks against formed legs") {
        RangeDistribution formed;
        REQUIRE_FALSE(impulsiveness(5.0, formed).has_value());

        formed.insert(1.0);
        formed.insert(2.0);
        formed.insert(3.0);
        formed.insert(4.0);
        REQUIRE(impulsiveness(3.5, formed).value() == 75.0);
    }
}
