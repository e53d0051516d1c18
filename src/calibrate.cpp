#include "calibrate.hpp"
#include <spdlog/spdlog.h>

void CalibrationSummary::count(const DetectionEvent& event) {
    switch (event.type) {
        case EventType::LegCreated: legs_created++; break;
        case EventType::SwingFormed: swings_formed++; break;
        case EventType::LegInvalidated: legs_invalidated++; break;
        case EventType::LegStale: legs_stale++; break;
        case EventType::LegPruned:
            if (event.reason) pruned_by_reason[to_string(*event.reason)]++;
            break;
        case EventType::LegExtended: break;
    }
}

nlohmann::json CalibrationSummary::to_json() const {
    return {
        {"bars_processed", bars_processed},
        {"legs_created", legs_created},
        {"swings_formed", swings_formed},
        {"legs_invalidated", legs_invalidated},
        {"legs_stale", legs_stale},
        {"pruned_by_reason", pruned_by_reason}
    };
}

CalibrationResult calibrate(Detector& detector, const std::vector<Bar>& bars) {
    CalibrationResult result;

    for (const auto& bar : bars) {
        auto events = detector.process_bar(bar);
        for (auto& e : events) {
            result.summary.count(e);
            result.events.push_back(std::move(e));
        }
        result.summary.bars_processed++;
    }

    spdlog::info("Calibrated over {} bars: {} legs created, {} swings formed, {} live legs",
                 result.summary.bars_processed, result.summary.legs_created,
                 result.summary.swings_formed, detector.hierarchy().size());
    for (const auto& [reason, n] : result.summary.pruned_by_reason) {
        spdlog::info("  Pruned ({}): {}", reason, n);
    }

    return result;
}
