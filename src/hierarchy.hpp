#pragma once

#include "leg.hpp"
#include "range_distribution.hpp"
#include <map>
#include <optional>
#include <vector>

// Arena of live legs (active or invalidated) addressed by id, with the
// parent/child forest over them. Removal always reattaches children to the
// removed leg's parent; there is no other way to take a leg out.
class Hierarchy {
public:
    Hierarchy() = default;

    // Rebuilds the arena from serialized legs; links are taken as stored
    static Hierarchy restore(std::map<LegId, Leg> legs, LegId next_id);

    // Assigns the next id and links the leg under leg.parent_id if set
    LegId insert(Leg leg);

    // Children move to the leg's parent (or become roots), then the leg is
    // erased. Returns the leg as it was before detaching.
    Leg reparent_on_removal(LegId id);

    // All pivot moves go through here so the range distribution stays in step
    void move_pivot(LegId id, double price, int64_t index);

    bool contains(LegId id) const;
    const Leg& at(LegId id) const;
    Leg& at(LegId id);

    const std::map<LegId, Leg>& legs() const { return legs_; }
    std::vector<LegId> ids() const;
    std::vector<LegId> roots() const;
    std::vector<LegId> ids_with(Direction direction, LegStatus status) const;
    size_t size() const { return legs_.size(); }
    bool empty() const { return legs_.empty(); }

    // Depth from the root, 0 for roots
    int depth(LegId id) const;
    std::optional<LegId> ancestor(LegId id, int generations) const;

    const RangeDistribution& ranges() const { return ranges_; }
    LegId next_id() const { return next_id_; }

private:
    std::map<LegId, Leg> legs_;
    RangeDistribution ranges_;
    LegId next_id_ = 1;
};
