#pragma once

#include "bar.hpp"
#include "detector.hpp"
#include "events.hpp"
#include <map>
#include <string>
#include <vector>

struct CalibrationSummary {
    int64_t bars_processed = 0;
    int64_t legs_created = 0;
    int64_t swings_formed = 0;
    int64_t legs_invalidated = 0;
    int64_t legs_stale = 0;
    std::map<std::string, int64_t> pruned_by_reason;

    void count(const DetectionEvent& event);
    nlohmann::json to_json() const;
};

struct CalibrationResult {
    std::vector<DetectionEvent> events;
    CalibrationSummary summary;
};

// Runs the bars through process_bar in order; the detector keeps the
// resulting state for live continuation.
CalibrationResult calibrate(Detector& detector, const std::vector<Bar>& bars);
