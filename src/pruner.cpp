#include "pruner.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

namespace {

bool same_location(double price_a, int64_t index_a, double price_b, int64_t index_b) {
    return price_a == price_b && index_a == index_b;
}

// Strict containment of `inner` inside `outer`, both of one direction
bool contains(const Leg& outer, const Leg& inner) {
    if (inner.direction == Direction::Bull) {
        return inner.origin_price > outer.origin_price && inner.pivot_price < outer.pivot_price;
    }
    return inner.origin_price < outer.origin_price && inner.pivot_price > outer.pivot_price;
}

} // namespace

Pruner::Pruner(const DetectionConfig& config) : config_(config) {}

std::vector<DetectionEvent> Pruner::apply(Hierarchy& hierarchy,
                                          const PruneContext& ctx,
                                          const Bar& bar) const {
    std::vector<DetectionEvent> events;

    prune_engulfed(hierarchy, bar, events);
    prune_stale(hierarchy, bar, events);
    prune_turn_limit(hierarchy, ctx, bar, events);
    prune_proximity(hierarchy, bar, events);
    if (config_.enable_inner_structure_prune) {
        prune_inner_structure(hierarchy, ctx, bar, events);
    }

    return events;
}

void Pruner::remove(Hierarchy& hierarchy, LegId id, EventType type,
                    std::optional<PruneReason> reason, const std::string& explanation,
                    const Bar& bar, std::vector<DetectionEvent>& events) const {
    Leg removed = hierarchy.reparent_on_removal(id);
    removed.status = type == EventType::LegStale ? LegStatus::Stale : LegStatus::Pruned;

    DetectionEvent e = make_event(type, removed, bar);
    e.reason = reason;
    e.explanation = explanation;
    if (type == EventType::LegStale && removed.max_origin_breach) {
        e.extension_ratio = *removed.max_origin_breach / removed.range();
    }

    spdlog::debug("Leg {} {} at bar {}{}", id,
                  reason ? "pruned (" + to_string(*reason) + ")" : std::string("stale"),
                  bar.index, explanation.empty() ? "" : ": " + explanation);
    events.push_back(std::move(e));
}

void Pruner::prune_engulfed(Hierarchy& hierarchy, const Bar& bar,
                            std::vector<DetectionEvent>& events) const {
    for (LegId id : hierarchy.ids()) {
        const Leg& leg = hierarchy.at(id);
        if (!leg.max_origin_breach || !leg.max_pivot_breach) continue;

        double limit = config_.for_direction(leg.direction).engulfment_threshold * leg.range();
        double worst = std::max(*leg.max_origin_breach, *leg.max_pivot_breach);
        if (worst > limit) {
            std::string why = "breach " + util::format_price(worst) +
                              " > " + util::format_price(limit);
            remove(hierarchy, id, EventType::LegPruned, PruneReason::Engulfed, why, bar, events);
        }
    }
}

void Pruner::prune_stale(Hierarchy& hierarchy, const Bar& bar,
                         std::vector<DetectionEvent>& events) const {
    for (LegId id : hierarchy.ids()) {
        const Leg& leg = hierarchy.at(id);
        if (leg.status != LegStatus::Invalidated || !leg.max_origin_breach) continue;

        if (*leg.max_origin_breach >= config_.stale_extension_threshold * leg.range()) {
            remove(hierarchy, id, EventType::LegStale, std::nullopt, "", bar, events);
        }
    }
}

void Pruner::prune_turn_limit(Hierarchy& hierarchy, const PruneContext& ctx, const Bar& bar,
                              std::vector<DetectionEvent>& events) const {
    for (LegId fresh_id : ctx.created) {
        if (!hierarchy.contains(fresh_id)) continue;

        const Leg& fresh = hierarchy.at(fresh_id);
        Direction counter = opposite(fresh.direction);
        double turn_price = fresh.origin_price;
        int64_t turn_index = fresh.origin_index;

        // Counter legs that ended where the new leg starts
        std::vector<LegId> gathered;
        double scale = 0.0;
        for (const auto& [id, leg] : hierarchy.legs()) {
            if (leg.direction != counter || leg.formed) continue;
            if (!same_location(leg.pivot_price, leg.pivot_index, turn_price, turn_index)) continue;
            gathered.push_back(id);
            scale = std::max(scale, leg.range());
        }
        if (gathered.empty()) continue;

        std::vector<LegId> contenders;
        for (LegId id : gathered) {
            if (hierarchy.at(id).turn_scale_survived <= scale) {
                contenders.push_back(id);
            }
        }

        std::sort(contenders.begin(), contenders.end(), [&hierarchy](LegId a, LegId b) {
            const Leg& la = hierarchy.at(a);
            const Leg& lb = hierarchy.at(b);
            if (la.origin_counter_trend_range != lb.origin_counter_trend_range) {
                return la.origin_counter_trend_range > lb.origin_counter_trend_range;
            }
            if (la.range() != lb.range()) {
                return la.range() > lb.range();
            }
            return a < b;
        });

        size_t keep = static_cast<size_t>(config_.max_legs_per_turn);
        for (size_t i = keep; i < contenders.size(); i++) {
            std::string why = "rank " + std::to_string(i + 1) + " of " +
                              std::to_string(contenders.size()) + " at turn " +
                              util::format_price(turn_price);
            remove(hierarchy, contenders[i], EventType::LegPruned, PruneReason::TurnLimit,
                   why, bar, events);
        }

        for (LegId id : gathered) {
            if (!hierarchy.contains(id)) continue;
            Leg& survivor = hierarchy.at(id);
            survivor.turn_scale_survived = std::max(survivor.turn_scale_survived, scale);
        }
    }
}

void Pruner::prune_proximity(Hierarchy& hierarchy, const Bar& bar,
                             std::vector<DetectionEvent>& events) const {
    using PivotKey = std::tuple<int, double, int64_t>;
    std::map<PivotKey, std::vector<LegId>> groups;
    for (const auto& [id, leg] : hierarchy.legs()) {
        if (leg.status != LegStatus::Active) continue;
        groups[{static_cast<int>(leg.direction), leg.pivot_price, leg.pivot_index}].push_back(id);
    }

    for (auto& [key, ids] : groups) {
        if (ids.size() < 2) continue;

        std::sort(ids.begin(), ids.end(), [&hierarchy](LegId a, LegId b) {
            double ra = hierarchy.at(a).range();
            double rb = hierarchy.at(b).range();
            if (ra != rb) return ra > rb;
            return a < b;
        });

        std::vector<LegId> kept;
        for (LegId id : ids) {
            const Leg& leg = hierarchy.at(id);
            if (leg.formed) {
                kept.push_back(id);
                continue;
            }

            std::optional<LegId> near;
            for (LegId k : kept) {
                const Leg& other = hierarchy.at(k);
                if (std::fabs(leg.origin_price - other.origin_price) <=
                    config_.proximity_tolerance * other.range()) {
                    near = k;
                    break;
                }
            }

            if (near) {
                remove(hierarchy, id, EventType::LegPruned, PruneReason::Proximity,
                       "origin near leg " + std::to_string(*near), bar, events);
            } else {
                kept.push_back(id);
            }
        }
    }
}

void Pruner::prune_inner_structure(Hierarchy& hierarchy, const PruneContext& ctx, const Bar& bar,
                                   std::vector<DetectionEvent>& events) const {
    if (ctx.invalidated.empty()) return;

    for (Direction dir : {Direction::Bear, Direction::Bull}) {
        // Contained pairs break one after the other, so a leg broken on this
        // bar is matched against every leg broken earlier too
        std::vector<Leg> broken;
        for (LegId id : hierarchy.ids_with(dir, LegStatus::Invalidated)) {
            broken.push_back(hierarchy.at(id));
        }
        if (broken.size() < 2) continue;

        Direction counter = opposite(dir);

        for (const Leg& inner : broken) {
            const Leg* outer = nullptr;
            for (const Leg& candidate : broken) {
                if (candidate.id == inner.id || !contains(candidate, inner)) continue;
                // Immediate container: origin closest to the inner leg's origin
                if (!outer || outer->origin_better_than(candidate.origin_price)) {
                    outer = &candidate;
                }
            }
            if (!outer) continue;

            // The outer leg must be the largest at its pivot, and nothing active may share it
            bool outer_dominant = true;
            for (const auto& [id, leg] : hierarchy.legs()) {
                if (id == outer->id || leg.direction != dir) continue;
                if (!same_location(leg.pivot_price, leg.pivot_index,
                                   outer->pivot_price, outer->pivot_index)) continue;
                if (leg.range() > outer->range() || leg.status == LegStatus::Active) {
                    outer_dominant = false;
                    break;
                }
            }
            if (!outer_dominant) continue;

            for (LegId id : hierarchy.ids_with(counter, LegStatus::Active)) {
                if (!hierarchy.contains(id)) continue;
                const Leg& redundant = hierarchy.at(id);
                if (redundant.formed) continue;
                if (!same_location(redundant.origin_price, redundant.origin_index,
                                   inner.pivot_price, inner.pivot_index)) continue;

                bool outer_origin_leg = false;
                for (const auto& [other_id, other] : hierarchy.legs()) {
                    if (other.direction != counter || other.status != LegStatus::Active) continue;
                    if (same_location(other.origin_price, other.origin_index,
                                      outer->pivot_price, outer->pivot_index) &&
                        same_location(other.pivot_price, other.pivot_index,
                                      redundant.pivot_price, redundant.pivot_index)) {
                        outer_origin_leg = true;
                        break;
                    }
                }
                if (!outer_origin_leg) continue;

                std::string why = "inner " + to_string(dir) + " leg " + std::to_string(inner.id) +
                                  " contained in leg " + std::to_string(outer->id);
                remove(hierarchy, id, EventType::LegPruned, PruneReason::InnerStructure,
                       why, bar, events);
            }
        }
    }
}

bool Pruner::would_be_dominated(const Hierarchy& hierarchy, Direction direction,
                                const SwingPoint& origin) const {
    for (const auto& [id, leg] : hierarchy.legs()) {
        if (leg.direction != direction || leg.status != LegStatus::Active) continue;
        // Legs from an earlier turn leave room for nested structure
        if (leg.origin_index < origin.turn_start) continue;
        if (leg.origin_price == origin.price || leg.origin_better_than(origin.price)) {
            return true;
        }
    }
    return false;
}

bool Pruner::violates_self_separation(const Hierarchy& hierarchy, Direction direction,
                                      double origin_price, double range) const {
    double min_gap = config_.for_direction(direction).self_separation * range;
    for (const auto& [id, leg] : hierarchy.legs()) {
        if (leg.direction != direction || leg.status != LegStatus::Active) continue;
        if (leg.range() < range) continue;
        if (std::fabs(leg.origin_price - origin_price) < min_gap) {
            return true;
        }
    }
    return false;
}

bool Pruner::violates_parent_separation(const Leg& parent, double origin_price) const {
    double min_gap = config_.for_direction(parent.direction).parent_child_separation * parent.range();
    return std::fabs(origin_price - parent.origin_price) < min_gap;
}
