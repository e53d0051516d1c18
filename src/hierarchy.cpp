#include "hierarchy.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

Hierarchy Hierarchy::restore(std::map<LegId, Leg> legs, LegId next_id) {
    Hierarchy h;
    std::vector<double> ranges;
    ranges.reserve(legs.size());
    for (const auto& [id, leg] : legs) {
        if (id >= next_id) {
            throw InvariantError("Leg id " + std::to_string(id) + " not below next id");
        }
        ranges.push_back(leg.range());
    }
    h.legs_ = std::move(legs);
    h.ranges_ = RangeDistribution(std::move(ranges));
    h.next_id_ = next_id;
    return h;
}

LegId Hierarchy::insert(Leg leg) {
    leg.id = next_id_++;
    leg.children.clear();

    if (leg.parent_id) {
        auto parent = legs_.find(*leg.parent_id);
        if (parent == legs_.end()) {
            throw InvariantError("Parent " + std::to_string(*leg.parent_id) + " is not live");
        }
        parent->second.children.insert(leg.id);
    }

    ranges_.insert(leg.range());
    LegId id = leg.id;
    legs_.emplace(id, std::move(leg));
    return id;
}

Leg Hierarchy::reparent_on_removal(LegId id) {
    auto it = legs_.find(id);
    if (it == legs_.end()) {
        throw InvariantError("Cannot remove unknown leg " + std::to_string(id));
    }
    Leg removed = it->second;

    for (LegId child_id : removed.children) {
        Leg& child = legs_.at(child_id);
        child.parent_id = removed.parent_id;
        if (removed.parent_id) {
            legs_.at(*removed.parent_id).children.insert(child_id);
        }
    }

    if (removed.parent_id) {
        legs_.at(*removed.parent_id).children.erase(id);
    }

    ranges_.erase(removed.range());
    legs_.erase(it);

    spdlog::debug("Removed leg {} ({} children reattached to {})", id, removed.children.size(),
                  removed.parent_id ? std::to_string(*removed.parent_id) : "root");
    return removed;
}

void Hierarchy::move_pivot(LegId id, double price, int64_t index) {
    Leg& leg = at(id);
    double old_range = leg.range();
    leg.pivot_price = price;
    leg.pivot_index = index;
    ranges_.replace(old_range, leg.range());
}

bool Hierarchy::contains(LegId id) const {
    return legs_.count(id) > 0;
}

const Leg& Hierarchy::at(LegId id) const {
    auto it = legs_.find(id);
    if (it == legs_.end()) {
        throw InvariantError("Unknown leg " + std::to_string(id));
    }
    return it->second;
}

Leg& Hierarchy::at(LegId id) {
    auto it = legs_.find(id);
    if (it == legs_.end()) {
        throw InvariantError("Unknown leg " + std::to_string(id));
    }
    return it->second;
}

std::vector<LegId> Hierarchy::ids() const {
    std::vector<LegId> out;
    out.reserve(legs_.size());
    for (const auto& [id, leg] : legs_) {
        out.push_back(id);
    }
    return out;
}

std::vector<LegId> Hierarchy::roots() const {
    std::vector<LegId> out;
    for (const auto& [id, leg] : legs_) {
        if (!leg.parent_id) out.push_back(id);
    }
    return out;
}

std::vector<LegId> Hierarchy::ids_with(Direction direction, LegStatus status) const {
    std::vector<LegId> out;
    for (const auto& [id, leg] : legs_) {
        if (leg.direction == direction && leg.status == status) out.push_back(id);
    }
    return out;
}

int Hierarchy::depth(LegId id) const {
    int d = 0;
    const Leg* leg = &at(id);
    while (leg->parent_id) {
        if (++d > static_cast<int>(legs_.size())) {
            throw InvariantError("Cycle in hierarchy at leg " + std::to_string(id));
        }
        leg = &at(*leg->parent_id);
    }
    return d;
}

std::optional<LegId> Hierarchy::ancestor(LegId id, int generations) const {
    std::optional<LegId> current = id;
    for (int i = 0; i < generations && current; i++) {
        current = at(*current).parent_id;
    }
    return current;
}
