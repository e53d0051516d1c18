#include "events.hpp"

std::string to_string(EventType type) {
    switch (type) {
        case EventType::LegCreated: return "LEG_CREATED";
        case EventType::LegExtended: return "LEG_EXTENDED";
        case EventType::SwingFormed: return "SWING_FORMED";
        case EventType::LegInvalidated: return "LEG_INVALIDATED";
        case EventType::LegPruned: return "LEG_PRUNED";
        case EventType::LegStale: return "LEG_STALE";
    }
    return "UNKNOWN";
}

std::string to_string(PruneReason reason) {
    switch (reason) {
        case PruneReason::Engulfed: return "engulfed";
        case PruneReason::TurnLimit: return "turn_limit";
        case PruneReason::Proximity: return "proximity";
        case PruneReason::InnerStructure: return "inner_structure";
    }
    return "unknown";
}

DetectionEvent make_event(EventType type, const Leg& leg, const Bar& bar) {
    DetectionEvent e;
    e.type = type;
    e.bar_index = bar.index;
    e.timestamp_ms = bar.timestamp_ms;
    e.leg_id = leg.id;
    e.direction = leg.direction;
    e.parent_id = leg.parent_id;
    e.children.assign(leg.children.begin(), leg.children.end());
    e.origin_price = leg.origin_price;
    e.origin_index = leg.origin_index;
    e.pivot_price = leg.pivot_price;
    e.pivot_index = leg.pivot_index;
    return e;
}

nlohmann::json DetectionEvent::to_json() const {
    nlohmann::json j;
    j["type"] = ::to_string(type);
    j["bar_index"] = bar_index;
    j["timestamp"] = timestamp_ms;
    j["leg_id"] = leg_id;
    j["direction"] = ::to_string(direction);
    j["parent_id"] = parent_id ? nlohmann::json(*parent_id) : nlohmann::json(nullptr);
    j["children"] = children;
    j["origin_price"] = origin_price;
    j["origin_index"] = origin_index;
    j["pivot_price"] = pivot_price;
    j["pivot_index"] = pivot_index;

    if (trigger_price) {
        j[type == EventType::SwingFormed ? "formation_price" : "invalidation_price"] = *trigger_price;
    }
    if (extension_ratio) j["extension_ratio"] = *extension_ratio;
    if (reason) j["reason"] = ::to_string(*reason);
    if (!explanation.empty()) j["explanation"] = explanation;

    return j;
}
