#include "invariants.hpp"
#include "errors.hpp"
#include <set>
#include <string>

void InvariantChecker::check(const Hierarchy& hierarchy,
                             const std::map<LegId, Swing>& swings,
                             const DetectionConfig& config) {
    check_links(hierarchy);
    check_anchors(hierarchy);

    for (const auto& [leg_id, swing] : swings) {
        if (!hierarchy.contains(leg_id)) {
            throw InvariantError("Swing " + std::to_string(leg_id) + " outlived its leg");
        }
        if (!hierarchy.at(leg_id).formed) {
            throw InvariantError("Swing " + std::to_string(leg_id) + " anchored to unformed leg");
        }
    }

    for (const auto& [id, leg] : hierarchy.legs()) {
        if (!leg.is_live()) {
            throw InvariantError("Leg " + std::to_string(id) + " kept with status " +
                                 to_string(leg.status));
        }
        if ((leg.status == LegStatus::Invalidated) != leg.max_origin_breach.has_value()) {
            throw InvariantError("Leg " + std::to_string(id) + " status disagrees with origin breach");
        }
        if (leg.max_origin_breach && leg.max_pivot_breach) {
            double limit = config.for_direction(leg.direction).engulfment_threshold * leg.range();
            if (*leg.max_origin_breach > limit || *leg.max_pivot_breach > limit) {
                throw InvariantError("Engulfed leg " + std::to_string(id) + " survived pruning");
            }
        }
    }

    if (hierarchy.ranges().size() != hierarchy.size()) {
        throw InvariantError("Range distribution out of step with leg arena");
    }
}

void InvariantChecker::check_links(const Hierarchy& hierarchy) const {
    for (const auto& [id, leg] : hierarchy.legs()) {
        if (leg.parent_id) {
            if (!hierarchy.contains(*leg.parent_id)) {
                throw InvariantError("Leg " + std::to_string(id) + " has dangling parent " +
                                     std::to_string(*leg.parent_id));
            }
            if (hierarchy.at(*leg.parent_id).children.count(id) == 0) {
                throw InvariantError("Parent of leg " + std::to_string(id) + " does not list it");
            }
        }
        for (LegId child : leg.children) {
            if (!hierarchy.contains(child) || hierarchy.at(child).parent_id != id) {
                throw InvariantError("Leg " + std::to_string(id) + " lists stray child " +
                                     std::to_string(child));
            }
        }

        // Walk up; a path longer than the arena means a cycle
        std::set<LegId> path = {id};
        std::optional<LegId> cur = leg.parent_id;
        while (cur) {
            if (!path.insert(*cur).second) {
                throw InvariantError("Cycle through leg " + std::to_string(*cur));
            }
            cur = hierarchy.at(*cur).parent_id;
        }
    }
}

void InvariantChecker::check_anchors(const Hierarchy& hierarchy) {
    std::map<LegId, Anchors> now;
    for (const auto& [id, leg] : hierarchy.legs()) {
        Anchors a{leg.origin_price, leg.origin_index, leg.pivot_price,
                  leg.max_origin_breach.has_value()};

        auto prev = seen_.find(id);
        if (prev != seen_.end()) {
            const Anchors& p = prev->second;
            if (p.origin_price != a.origin_price || p.origin_index != a.origin_index) {
                throw InvariantError("Origin of leg " + std::to_string(id) + " moved");
            }
            if (p.breached && p.pivot_price != a.pivot_price) {
                throw InvariantError("Pivot of leg " + std::to_string(id) + " moved after breach");
            }
            bool retreated = leg.direction == Direction::Bull
                ? a.pivot_price < p.pivot_price
                : a.pivot_price > p.pivot_price;
            if (retreated) {
                throw InvariantError("Pivot of leg " + std::to_string(id) + " retreated");
            }
        }
        now.emplace(id, a);
    }
    seen_ = std::move(now);
}
