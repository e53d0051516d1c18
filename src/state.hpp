#pragma once

#include "bar.hpp"
#include "leg.hpp"
#include "swing.hpp"
#include "swing_points.hpp"
#include <map>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

// Everything needed to resume detection exactly where a run stopped:
// the leg arena with hierarchy links, swings, pending swing points, the
// confirmation window and the frozen formed-impulse population.
struct DetectorState {
    static constexpr int kVersion = 1;

    std::map<LegId, Leg> legs;
    LegId next_leg_id = 1;
    std::map<LegId, Swing> swings;

    std::vector<Bar> bar_window;
    std::vector<SwingPoint> swing_points;
    int64_t last_high_index = -1;
    int64_t last_low_index = -1;

    std::vector<double> formed_impulses;

    int64_t last_bar_index = -1;
    std::optional<int64_t> last_timestamp_ms;

    nlohmann::json to_json() const;
    // Throws SnapshotError on a malformed or foreign document
    static DetectorState from_json(const nlohmann::json& j);
};
