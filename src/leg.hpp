#pragma once

#include "impulse.hpp"
#include "reference_frame.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

using LegId = uint64_t;

enum class Direction {
    Bull,  // origin is a low, pivot a high
    Bear   // origin is a high, pivot a low
};

enum class LegStatus {
    Active,
    Invalidated,
    Stale,
    Pruned
};

std::string to_string(Direction direction);
std::string to_string(LegStatus status);
Direction direction_from_string(const std::string& s);
LegStatus leg_status_from_string(const std::string& s);
Direction opposite(Direction direction);

struct Leg {
    LegId id = 0;
    Direction direction = Direction::Bull;

    double origin_price = 0.0;
    int64_t origin_index = 0;
    double pivot_price = 0.0;
    int64_t pivot_index = 0;

    LegStatus status = LegStatus::Active;
    bool formed = false;

    std::optional<double> max_origin_breach;
    std::optional<double> max_pivot_breach;

    std::optional<LegId> parent_id;
    std::set<LegId> children;

    int64_t created_index = 0;

    // Largest counter-direction leg ending at this leg's origin, at creation
    double origin_counter_trend_range = 0.0;
    // Largest turn scale this leg has been kept at by the turn limit
    double turn_scale_survived = 0.0;

    ImpulseMoments moments;
    std::optional<double> impulsiveness;

    double range() const;
    int64_t bar_count() const { return pivot_index - origin_index; }
    // Points per bar between origin and pivot
    double impulse() const;
    std::optional<double> spikiness() const { return moments.spikiness(); }

    ReferenceFrame frame() const { return ReferenceFrame(origin_price, pivot_price); }
    // Adverse extreme of a bar: the side that can breach the origin
    double adverse_price(double high, double low) const;
    double favorable_price(double high, double low) const;
    // How far `price` sits beyond the origin, 0 when on the inside
    double distance_beyond_origin(double price) const;
    double distance_beyond_pivot(double price) const;

    bool is_live() const { return status == LegStatus::Active || status == LegStatus::Invalidated; }
    // Origin better than `price` for this direction (lower for bull)
    bool origin_better_than(double price) const;

    nlohmann::json to_json() const;
    static Leg from_json(const nlohmann::json& j);
};
