#include "leg.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string to_string(Direction direction) {
    return direction == Direction::Bull ? "bull" : "bear";
}

std::string to_string(LegStatus status) {
    switch (status) {
        case LegStatus::Active: return "active";
        case LegStatus::Invalidated: return "invalidated";
        case LegStatus::Stale: return "stale";
        case LegStatus::Pruned: return "pruned";
    }
    return "unknown";
}

Direction direction_from_string(const std::string& s) {
    if (s == "bull") return Direction::Bull;
    if (s == "bear") return Direction::Bear;
    throw std::invalid_argument("Unknown direction: " + s);
}

LegStatus leg_status_from_string(const std::string& s) {
    if (s == "active") return LegStatus::Active;
    if (s == "invalidated") return LegStatus::Invalidated;
    if (s == "stale") return LegStatus::Stale;
    if (s == "pruned") return LegStatus::Pruned;
    throw std::invalid_argument("Unknown leg status: " + s);
}

Direction opposite(Direction direction) {
    return direction == Direction::Bull ? Direction::Bear : Direction::Bull;
}

double Leg::range() const {
    return std::fabs(pivot_price - origin_price);
}

double Leg::impulse() const {
    int64_t bars = std::max<int64_t>(1, bar_count());
    return range() / static_cast<double>(bars);
}

double Leg::adverse_price(double high, double low) const {
    return direction == Direction::Bull ? low : high;
}

double Leg::favorable_price(double high, double low) const {
    return direction == Direction::Bull ? high : low;
}

double Leg::distance_beyond_origin(double price) const {
    double d = direction == Direction::Bull ? origin_price - price : price - origin_price;
    return std::max(0.0, d);
}

double Leg::distance_beyond_pivot(double price) const {
    double d = direction == Direction::Bull ? price - pivot_price : pivot_price - price;
    return std::max(0.0, d);
}

bool Leg::origin_better_than(double price) const {
    return direction == Direction::Bull ? origin_price < price : origin_price > price;
}

nlohmann::json Leg::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"direction", to_string(direction)},
        {"origin_price", origin_price},
        {"origin_index", origin_index},
        {"pivot_price", pivot_price},
        {"pivot_index", pivot_index},
        {"status", to_string(status)},
        {"formed", formed},
        {"max_origin_breach", nullptr},
        {"max_pivot_breach", nullptr},
        {"parent_id", nullptr},
        {"children", children},
        {"created_index", created_index},
        {"origin_counter_trend_range", origin_counter_trend_range},
        {"turn_scale_survived", turn_scale_survived},
        {"moments", moments.to_json()},
        {"impulsiveness", nullptr}
    };
    if (max_origin_breach) j["max_origin_breach"] = *max_origin_breach;
    if (max_pivot_breach) j["max_pivot_breach"] = *max_pivot_breach;
    if (parent_id) j["parent_id"] = *parent_id;
    if (impulsiveness) j["impulsiveness"] = *impulsiveness;
    return j;
}

namespace {

std::optional<double> optional_double(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<double>();
}

} // namespace

Leg Leg::from_json(const nlohmann::json& j) {
    Leg leg;
    leg.id = j.at("id").get<LegId>();
    leg.direction = direction_from_string(j.at("direction").get<std::string>());
    leg.origin_price = j.at("origin_price").get<double>();
    leg.origin_index = j.at("origin_index").get<int64_t>();
    leg.pivot_price = j.at("pivot_price").get<double>();
    leg.pivot_index = j.at("pivot_index").get<int64_t>();
    leg.status = leg_status_from_string(j.at("status").get<std::string>());
    leg.formed = j.at("formed").get<bool>();
    leg.max_origin_breach = optional_double(j, "max_origin_breach");
    leg.max_pivot_breach = optional_double(j, "max_pivot_breach");
    if (j.contains("parent_id") && !j.at("parent_id").is_null()) {
        leg.parent_id = j.at("parent_id").get<LegId>();
    }
    leg.children = j.at("children").get<std::set<LegId>>();
    leg.created_index = j.at("created_index").get<int64_t>();
    leg.origin_counter_trend_range = j.value("origin_counter_trend_range", 0.0);
    leg.turn_scale_survived = j.value("turn_scale_survived", 0.0);
    leg.moments = ImpulseMoments::from_json(j.at("moments"));
    leg.impulsiveness = optional_double(j, "impulsiveness");
    return leg;
}
