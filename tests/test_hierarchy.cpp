#include <catch2/catch_test_macros.hpp>
#include "../src/hierarchy.hpp"
#include "../src/errors.hpp"

namespace {

Leg bull_leg(double origin, double pivot, int64_t origin_index, std::optional<LegId> parent = std::nullopt) {
    Leg leg;
    leg.direction = Direction::Bull;
    leg.origin_price = origin;
    leg.origin_index = origin_index;
    leg.pivot_price = pivot;
    leg.pivot_index = origin_index + 5;
    leg.parent_id = parent;
    return leg;
}

} // namespace

TEST_CASE("Hierarchy links and removal", "[hierarchy]") {
    Hierarchy h;
    LegId a = h.insert(bull_leg(100.0, 200.0, 0));
    LegId b = h.insert(bull_leg(120.0, 200.0, 10, a));
    LegId c = h.insert(bull_leg(150.0, 200.0, 20, b));

    SECTION("Insert assigns ids and links parents") {
        REQUIRE(a == 1);
        REQUIRE(b == 2);
        REQUIRE(c == 3);
        REQUIRE(h.at(a).children.count(b) == 1);
        REQUIRE(h.at(b).children.count(c) == 1);
        REQUIRE(h.depth(c) == 2);
        REQUIRE(h.ancestor(c, 2) == a);
        REQUIRE(h.roots() == std::vector<LegId>{a});
        REQUIRE(h.ranges().size() == 3);
    }

    SECTION("Removing a middle leg reattaches its children to its parent") {
        Leg removed = h.reparent_on_removal(b);

        REQUIRE(removed.id == b);
        REQUIRE(removed.children.count(c) == 1);
        REQUIRE_FALSE(h.contains(b));
        REQUIRE(h.at(c).parent_id == a);
        REQUIRE(h.at(a).children == std::set<LegId>{c});
        REQUIRE(h.ranges().size() == 2);
    }

    SECTION("Removing a root turns its children into roots") {
        h.reparent_on_removal(a);

        REQUIRE_FALSE(h.at(b).parent_id.has_value());
        REQUIRE(h.roots() == std::vector<LegId>{b});
        REQUIRE(h.at(c).parent_id == b);
    }

    SECTION("Pivot moves keep the range distribution in step") {
        h.move_pivot(c, 260.0, 30);

        REQUIRE(h.at(c).pivot_price == 260.0);
        REQUIRE(h.at(c).pivot_index == 30);
        REQUIRE(h.ranges().values().back() == 110.0);
        REQUIRE(h.ranges().size() == 3);
    }

    SECTION("Unknown ids are defects") {
        REQUIRE_THROWS_AS(h.reparent_on_removal(42), InvariantError);
        REQUIRE_THROWS_AS(h.insert(bull_leg(90.0, 95.0, 1, 42)), InvariantError);
    }
}

TEST_CASE("Hierarchy restore", "[hierarchy]") {
    Hierarchy h;
    LegId a = h.insert(bull_leg(100.0, 200.0, 0));
    h.insert(bull_leg(120.0, 200.0, 10, a));

    SECTION("Round trip keeps links and next id") {
        Hierarchy copy = Hierarchy::restore(h.legs(), h.next_id());

        REQUIRE(copy.size() == 2);
        REQUIRE(copy.next_id() == 3);
        REQUIRE(copy.at(2).parent_id == a);
        REQUIRE(copy.ranges().values() == h.ranges().values());
    }

    SECTION("Ids at or above next id are rejected") {
        REQUIRE_THROWS_AS(Hierarchy::restore(h.legs(), 2), InvariantError);
    }
}
