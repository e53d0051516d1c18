#include "detector.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace {

// Absorbs rounding when a close lands exactly on the formation level
constexpr double kFormationEpsilon = 1e-9;

} // namespace

Detector::Detector(const DetectionConfig& config)
    : config_(config),
      pruner_(config),
      points_(config.lookback, config.max_pair_distance) {
    config_.validate();
}

Detector Detector::restore(const DetectorState& state, const DetectionConfig& config) {
    Detector d(config);
    d.hierarchy_ = Hierarchy::restore(state.legs, state.next_leg_id);
    d.swings_ = state.swings;
    d.points_.restore(state.bar_window, state.swing_points,
                      state.last_high_index, state.last_low_index);
    d.formed_impulses_ = RangeDistribution(state.formed_impulses);
    d.last_bar_index_ = state.last_bar_index;
    d.last_timestamp_ms_ = state.last_timestamp_ms;

    for (const auto& [leg_id, swing] : d.swings_) {
        if (!d.hierarchy_.contains(leg_id)) {
            throw SnapshotError("Snapshot swing " + std::to_string(leg_id) + " has no leg");
        }
    }

    spdlog::info("Restored detector at bar {} with {} legs, {} swings",
                 d.last_bar_index_, d.hierarchy_.size(), d.swings_.size());
    return d;
}

DetectorState Detector::snapshot() const {
    DetectorState state;
    state.legs = hierarchy_.legs();
    state.next_leg_id = hierarchy_.next_id();
    state.swings = swings_;
    state.bar_window.assign(points_.window().begin(), points_.window().end());
    state.swing_points.assign(points_.points().begin(), points_.points().end());
    state.last_high_index = points_.last_high_index();
    state.last_low_index = points_.last_low_index();
    state.formed_impulses = formed_impulses_.values();
    state.last_bar_index = last_bar_index_;
    state.last_timestamp_ms = last_timestamp_ms_;
    return state;
}

void Detector::validate_order(const Bar& bar) const {
    bar.validate();
    if (last_timestamp_ms_ && bar.timestamp_ms <= *last_timestamp_ms_) {
        throw BarOrderError("Bar timestamp " + std::to_string(bar.timestamp_ms) +
                            " is not after " + std::to_string(*last_timestamp_ms_));
    }
}

std::vector<DetectionEvent> Detector::process_bar(Bar bar) {
    validate_order(bar);
    bar.index = last_bar_index_ + 1;

    std::vector<DetectionEvent> events;

    // 1. Extension and running moments
    update_moments(bar);
    extend_legs(bar, events);

    // 2. Point confirmation and pairing
    PruneContext ctx;
    ctx.created = confirm_and_pair(bar, events);

    // 3. Breach tracking
    ctx.invalidated = track_breaches(bar, events);

    // 4. Formation
    check_formation(bar, events);

    // 5. Pruning
    auto removals = pruner_.apply(hierarchy_, ctx, bar);
    drop_swings(removals);
    events.insert(events.end(), removals.begin(), removals.end());

    update_impulsiveness();

    last_bar_index_ = bar.index;
    last_timestamp_ms_ = bar.timestamp_ms;

    if (config_.check_invariants) {
        invariants_.check(hierarchy_, swings_, config_);
    }

    return events;
}

void Detector::update_moments(const Bar& bar) {
    if (points_.window().empty()) return;
    const Bar& prev = points_.window().back();

    for (LegId id : hierarchy_.ids()) {
        Leg& leg = hierarchy_.at(id);
        if (leg.status != LegStatus::Active) continue;
        // First bar after creation has no baseline inside the leg
        if (bar.index <= leg.created_index + 1) continue;

        double contribution = leg.direction == Direction::Bull
            ? bar.close - prev.high
            : prev.low - bar.close;
        leg.moments.add(contribution);
    }
}

void Detector::extend_legs(const Bar& bar, std::vector<DetectionEvent>& events) {
    for (LegId id : hierarchy_.ids()) {
        const Leg& leg = hierarchy_.at(id);
        if (leg.status != LegStatus::Active || leg.max_origin_breach) continue;

        double extreme = leg.favorable_price(bar.high, bar.low);
        if (leg.distance_beyond_pivot(extreme) <= 0.0) continue;

        hierarchy_.move_pivot(id, extreme, bar.index);
        const Leg& extended = hierarchy_.at(id);
        spdlog::debug("Leg {} extended to {} at bar {}", id, extreme, bar.index);
        events.push_back(make_event(EventType::LegExtended, extended, bar));
    }
}

std::vector<LegId> Detector::confirm_and_pair(const Bar& bar, std::vector<DetectionEvent>& events) {
    std::vector<LegId> created;
    for (const auto& pivot : points_.observe(bar)) {
        pair_into_legs(pivot, bar, created, events);
    }
    return created;
}

void Detector::pair_into_legs(const SwingPoint& pivot, const Bar& bar,
                              std::vector<LegId>& created, std::vector<DetectionEvent>& events) {
    Direction direction = pivot.type == PointType::High ? Direction::Bull : Direction::Bear;

    for (const auto& origin : points_.candidates_for(pivot)) {
        double range = std::fabs(pivot.price - origin.price);

        if (pruner_.would_be_dominated(hierarchy_, direction, origin)) {
            spdlog::debug("Skipped {} origin {} at bar {}: dominated",
                          to_string(direction), origin.price, origin.index);
            continue;
        }
        if (pruner_.violates_self_separation(hierarchy_, direction, origin.price, range)) {
            spdlog::debug("Skipped {} origin {} at bar {}: too close to a larger leg",
                          to_string(direction), origin.price, origin.index);
            continue;
        }

        auto parent = find_parent(direction, origin.price, origin.index);
        if (parent && pruner_.violates_parent_separation(hierarchy_.at(*parent), origin.price)) {
            spdlog::debug("Skipped {} origin {} at bar {}: too close to parent {}",
                          to_string(direction), origin.price, origin.index, *parent);
            continue;
        }

        Leg leg;
        leg.direction = direction;
        leg.origin_price = origin.price;
        leg.origin_index = origin.index;
        leg.pivot_price = pivot.price;
        leg.pivot_index = pivot.index;
        leg.parent_id = parent;
        leg.created_index = bar.index;
        leg.origin_counter_trend_range = counter_trend_range_at(direction, origin.price, origin.index);

        LegId id = hierarchy_.insert(std::move(leg));
        points_.consume(origin.type, origin.index);
        created.push_back(id);

        const Leg& stored = hierarchy_.at(id);
        spdlog::debug("Created {} leg {} {}@{} -> {}@{}", to_string(direction), id,
                      stored.origin_price, stored.origin_index,
                      stored.pivot_price, stored.pivot_index);
        events.push_back(make_event(EventType::LegCreated, stored, bar));
    }
}

std::optional<LegId> Detector::find_parent(Direction direction, double origin_price,
                                           int64_t origin_index) const {
    std::optional<LegId> best;
    double best_gap = 0.0;
    int64_t best_index = 0;

    for (const auto& [id, leg] : hierarchy_.legs()) {
        if (leg.direction != direction || leg.status != LegStatus::Active) continue;
        if (!leg.origin_better_than(origin_price) || leg.origin_index >= origin_index) continue;

        double gap = std::fabs(origin_price - leg.origin_price);
        if (!best || gap < best_gap || (gap == best_gap && leg.origin_index > best_index)) {
            best = id;
            best_gap = gap;
            best_index = leg.origin_index;
        }
    }
    return best;
}

double Detector::counter_trend_range_at(Direction direction, double price, int64_t index) const {
    double largest = 0.0;
    Direction counter = opposite(direction);
    for (const auto& [id, leg] : hierarchy_.legs()) {
        if (leg.direction == counter && leg.pivot_price == price && leg.pivot_index == index) {
            largest = std::max(largest, leg.range());
        }
    }
    return largest;
}

bool Detector::is_big(const Leg& leg) const {
    double fraction = config_.for_direction(leg.direction).big_swing_threshold;
    return hierarchy_.ranges().in_top_fraction(leg.range(), fraction);
}

Detector::BreachTolerance Detector::tolerance_for(const Leg& leg) const {
    BreachTolerance none{false, 0.0, 0.0};
    if (!leg.formed) return none;

    const DirectionConfig& dc = config_.for_direction(leg.direction);
    if (is_big(leg)) {
        return {true, dc.big_swing_price_tolerance, dc.big_swing_close_tolerance};
    }
    for (int generation = 1; generation <= 2; generation++) {
        auto ancestor = hierarchy_.ancestor(leg.id, generation);
        if (ancestor && is_big(hierarchy_.at(*ancestor))) {
            return {true, dc.child_swing_tolerance, dc.child_swing_tolerance};
        }
    }
    return none;
}

std::vector<LegId> Detector::track_breaches(const Bar& bar, std::vector<DetectionEvent>& events) {
    std::vector<LegId> invalidated;

    for (LegId id : hierarchy_.ids()) {
        Leg& leg = hierarchy_.at(id);
        double adverse = leg.adverse_price(bar.high, bar.low);

        if (leg.status == LegStatus::Active) {
            BreachTolerance tol = tolerance_for(leg);
            ReferenceFrame frame = leg.frame();
            bool violated = frame.is_violated(bar.close, tol.close) ||
                            (tol.check_touch && frame.is_violated(adverse, tol.touch));
            if (!violated) continue;

            leg.max_origin_breach = leg.distance_beyond_origin(adverse);
            leg.status = LegStatus::Invalidated;

            auto swing = swings_.find(id);
            if (swing != swings_.end()) {
                SwingFormer::mirror_status(swing->second, leg);
            }

            DetectionEvent e = make_event(EventType::LegInvalidated, leg, bar);
            e.trigger_price = adverse;
            events.push_back(std::move(e));
            invalidated.push_back(id);
            spdlog::debug("Leg {} invalidated at bar {} ({})", id, bar.index, adverse);
        } else if (leg.status == LegStatus::Invalidated) {
            double origin_breach = leg.distance_beyond_origin(adverse);
            if (origin_breach > *leg.max_origin_breach) {
                leg.max_origin_breach = origin_breach;
            }

            // Pivot is frozen from here on, so price beyond it is a breach
            double pivot_breach = leg.distance_beyond_pivot(leg.favorable_price(bar.high, bar.low));
            if (pivot_breach > 0.0 && (!leg.max_pivot_breach || pivot_breach > *leg.max_pivot_breach)) {
                leg.max_pivot_breach = pivot_breach;
            }
        }
    }
    return invalidated;
}

void Detector::check_formation(const Bar& bar, std::vector<DetectionEvent>& events) {
    for (LegId id : hierarchy_.ids()) {
        Leg& leg = hierarchy_.at(id);
        if (leg.status != LegStatus::Active || leg.formed) continue;

        double retracement = 1.0 - leg.frame().ratio(bar.close);
        double threshold = config_.for_direction(leg.direction).formation_threshold;
        if (retracement + kFormationEpsilon < threshold) continue;

        leg.formed = true;
        swings_[id] = SwingFormer::form(leg, bar);
        formed_impulses_.insert(leg.impulse());

        DetectionEvent e = make_event(EventType::SwingFormed, leg, bar);
        e.trigger_price = bar.close;
        events.push_back(std::move(e));
        spdlog::debug("Leg {} formed at bar {} (retracement {:.3f})", id, bar.index, retracement);
    }
}

void Detector::drop_swings(const std::vector<DetectionEvent>& removals) {
    for (const auto& e : removals) {
        swings_.erase(e.leg_id);
    }
}

void Detector::update_impulsiveness() {
    for (LegId id : hierarchy_.ids()) {
        Leg& leg = hierarchy_.at(id);
        if (leg.status != LegStatus::Active) continue;
        leg.impulsiveness = impulsiveness(leg.impulse(), formed_impulses_);
    }
}
