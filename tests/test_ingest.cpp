#include <catch2/catch_test_macros.hpp>
#include "../src/ingest.hpp"

namespace {

nlohmann::json bar_json(int64_t ts, double price) {
    return {{"timestamp", ts}, {"open", price}, {"high", price + 1.0},
            {"low", price - 1.0}, {"close", price}};
}

} // namespace

TEST_CASE("Bar message ingestion", "[ingest]") {
    Detector detector{DetectionConfig{}};

    SECTION("Valid bar is processed") {
        auto result = ingest_bar(detector, bar_json(1000, 50.0));
        REQUIRE(result.status == IngestStatus::Processed);
        REQUIRE(result.error.empty());
        REQUIRE(detector.last_bar_index() == 0);
    }

    SECTION("Missing field is rejected and the next bar still goes through") {
        nlohmann::json payload = bar_json(1000, 50.0);
        payload.erase("close");
        auto result = ingest_bar(detector, payload);
        REQUIRE(result.status == IngestStatus::Rejected);
        REQUIRE_FALSE(result.error.empty());
        REQUIRE(detector.last_bar_index() == -1);

        REQUIRE(ingest_bar(detector, bar_json(2000, 51.0)).status == IngestStatus::Processed);
        REQUIRE(detector.last_bar_index() == 0);
    }

    SECTION("Unparseable payload is rejected") {
        auto payload = nlohmann::json::parse("{not json", nullptr, false);
        REQUIRE(ingest_bar(detector, payload).status == IngestStatus::Rejected);
    }

    SECTION("Out-of-order bar is rejected") {
        ingest_bar(detector, bar_json(1000, 50.0));
        auto result = ingest_bar(detector, bar_json(1000, 52.0));
        REQUIRE(result.status == IngestStatus::Rejected);
        REQUIRE(detector.last_bar_index() == 0);
    }
}

TEST_CASE("Detector failures are reported, not thrown", "[ingest]") {
    // A zero-range leg cannot build a reference frame
    Leg leg;
    leg.id = 1;
    leg.origin_price = 100.0;
    leg.pivot_price = 100.0;
    DetectorState state;
    state.legs.emplace(1, leg);
    state.next_leg_id = 2;
    Detector detector = Detector::restore(state, DetectionConfig{});

    nlohmann::json flat = {{"timestamp", 1000}, {"open", 100.0}, {"high", 100.0},
                           {"low", 100.0}, {"close", 100.0}};
    IngestResult result;
    REQUIRE_NOTHROW(result = ingest_bar(detector, flat));
    REQUIRE(result.status == IngestStatus::Failed);
    REQUIRE_FALSE(result.error.empty());
}
