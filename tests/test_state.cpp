#include <catch2/catch_test_macros.hpp>
#include "../src/calibrate.hpp"
#include "../src/detector.hpp"
#include "../src/errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <string>

namespace {

// Deterministic wavy series with noise on three frequencies
std::vector<Bar> synthetic_bars(int n) {
    std::vector<Bar> bars;
    double prev_close = 100.0;
    for (int i = 0; i < n; i++) {
        double x = static_cast<double>(i);
        double p = 100.0 + 10.0 * std::sin(0.13 * x) + 4.0 * std::sin(0.71 * x) +
                   2.0 * std::sin(2.3 * x);
        double pad = 0.5 + 0.3 * std::fabs(std::sin(1.7 * x));

        Bar bar;
        bar.timestamp_ms = 1700000000000 + static_cast<int64_t>(i) * 60000;
        bar.open = prev_close;
        bar.close = p;
        bar.high = std::max(bar.open, bar.close) + pad;
        bar.low = std::min(bar.open, bar.close) - pad;
        bars.push_back(bar);
        prev_close = p;
    }
    return bars;
}

std::string dump_events(const std::vector<DetectionEvent>& events) {
    std::string out;
    for (const auto& e : events) {
        out += e.to_json().dump();
        out += "\n";
    }
    return out;
}

DetectionConfig checked_config() {
    DetectionConfig config;
    config.check_invariants = true;
    return config;
}

} // namespace

TEST_CASE("Snapshot and resume matches an uninterrupted run", "[state]") {
    const auto bars = synthetic_bars(400);
    const size_t split = 173;

    Detector batch(checked_config());
    auto full = calibrate(batch, bars);

    Detector first(checked_config());
    std::vector<Bar> head(bars.begin(), bars.begin() + split);
    std::vector<Bar> tail(bars.begin() + split, bars.end());
    auto before = calibrate(first, head);

    std::string saved = first.snapshot().to_json().dump();
    Detector resumed = Detector::restore(
        DetectorState::from_json(nlohmann::json::parse(saved)), checked_config());
    auto after = calibrate(resumed, tail);

    std::vector<DetectionEvent> joined = before.events;
    joined.insert(joined.end(), after.events.begin(), after.events.end());

    REQUIRE(full.summary.legs_created > 0);
    REQUIRE(dump_events(joined) == dump_events(full.events));
    REQUIRE(resumed.snapshot().to_json().dump() == batch.snapshot().to_json().dump());
    REQUIRE(resumed.last_bar_index() == 399);
}

TEST_CASE("Run-level properties on a synthetic series", "[state]") {
    const auto bars = synthetic_bars(400);
    Detector detector(checked_config());
    auto result = calibrate(detector, bars);

    std::set<LegId> formed;
    for (const auto& e : result.events) {
        if (e.type == EventType::SwingFormed) {
            REQUIRE(formed.insert(e.leg_id).second);
        }
    }

    for (const auto& [leg_id, swing] : detector.swings()) {
        REQUIRE(detector.hierarchy().contains(leg_id));
        REQUIRE(detector.hierarchy().at(leg_id).formed);
    }

    for (const auto& [id, leg] : detector.hierarchy().legs()) {
        REQUIRE(leg.is_live());
        if (leg.parent_id) {
            const Leg& parent = detector.hierarchy().at(*leg.parent_id);
            REQUIRE(parent.direction == leg.direction);
            REQUIRE(parent.children.count(id) == 1);
        }
    }
}

TEST_CASE("Snapshot documents are validated", "[state]") {
    SECTION("Foreign version") {
        nlohmann::json j = DetectorState{}.to_json();
        j["version"] = 99;
        REQUIRE_THROWS_AS(DetectorState::from_json(j), SnapshotError);
    }

    SECTION("Missing fields") {
        nlohmann::json j = {{"version", DetectorState::kVersion}};
        REQUIRE_THROWS_AS(DetectorState::from_json(j), SnapshotError);
    }

    SECTION("Unknown leg direction") {
        Leg leg;
        leg.id = 1;
        leg.origin_price = 1.0;
        leg.pivot_price = 2.0;
        DetectorState state;
        state.legs.emplace(1, leg);
        state.next_leg_id = 2;

        nlohmann::json j = state.to_json();
        j["legs"][0]["direction"] = "sideways";
        REQUIRE_THROWS_AS(DetectorState::from_json(j), SnapshotError);
    }

    SECTION("Swing without its leg") {
        Leg leg;
        leg.id = 1;
        leg.origin_price = 1.0;
        leg.pivot_price = 2.0;
        leg.formed = true;
        Bar bar;
        bar.index = 3;
        bar.close = 1.5;

        DetectorState state;
        state.swings.emplace(1, SwingFormer::form(leg, bar));
        REQUIRE_THROWS_AS(Detector::restore(state, DetectionConfig{}), SnapshotError);
    }

    SECTION("Empty state round trips") {
        DetectorState state = DetectorState::from_json(DetectorState{}.to_json());
        REQUIRE(state.legs.empty());
        REQUIRE(state.last_bar_index == -1);
        REQUIRE_FALSE(state.last_timestamp_ms.has_value());
    }
}
