#pragma once

#include "bar.hpp"
#include "leg.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class EventType {
    LegCreated,
    LegExtended,
    SwingFormed,
    LegInvalidated,
    LegPruned,
    LegStale
};

enum class PruneReason {
    Engulfed,
    TurnLimit,
    Proximity,
    InnerStructure
};

std::string to_string(EventType type);
std::string to_string(PruneReason reason);

struct DetectionEvent {
    EventType type = EventType::LegCreated;
    int64_t bar_index = 0;
    int64_t timestamp_ms = 0;

    LegId leg_id = 0;
    Direction direction = Direction::Bull;
    std::optional<LegId> parent_id;
    std::vector<LegId> children;

    double origin_price = 0.0;
    int64_t origin_index = 0;
    double pivot_price = 0.0;
    int64_t pivot_index = 0;

    // Breaching extreme for LEG_INVALIDATED, forming close for SWING_FORMED
    std::optional<double> trigger_price;
    // Distance past the origin in ranges, LEG_STALE only
    std::optional<double> extension_ratio;
    std::optional<PruneReason> reason;
    std::string explanation;

    nlohmann::json to_json() const;
};

// Populates identity, hierarchy and anchors from the leg as it stands now
DetectionEvent make_event(EventType type, const Leg& leg, const Bar& bar);
