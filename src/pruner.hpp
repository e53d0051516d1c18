#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "events.hpp"
#include "hierarchy.hpp"
#include "swing_points.hpp"
#include <vector>

struct PruneContext {
    std::vector<LegId> created;      // legs paired on this bar
    std::vector<LegId> invalidated;  // legs whose origin broke on this bar; gates inner structure
};

class Pruner {
public:
    explicit Pruner(const DetectionConfig& config);

    // Engulfment, staleness, turn limit, proximity, then inner structure.
    // Every removal reattaches children through the hierarchy.
    std::vector<DetectionEvent> apply(Hierarchy& hierarchy,
                                      const PruneContext& ctx,
                                      const Bar& bar) const;

    // Creation-time rules, consulted by the detector before a leg exists

    // An active same-direction leg from the same turn already holds an
    // origin at least as good
    bool would_be_dominated(const Hierarchy& hierarchy, Direction direction,
                            const SwingPoint& origin) const;
    bool violates_self_separation(const Hierarchy& hierarchy, Direction direction,
                                  double origin_price, double range) const;
    bool violates_parent_separation(const Leg& parent, double origin_price) const;

private:
    void prune_engulfed(Hierarchy& hierarchy, const Bar& bar,
                        std::vector<DetectionEvent>& events) const;
    void prune_stale(Hierarchy& hierarchy, const Bar& bar,
                     std::vector<DetectionEvent>& events) const;
    void prune_turn_limit(Hierarchy& hierarchy, const PruneContext& ctx, const Bar& bar,
                          std::vector<DetectionEvent>& events) const;
    void prune_proximity(Hierarchy& hierarchy, const Bar& bar,
                         std::vector<DetectionEvent>& events) const;
    void prune_inner_structure(Hierarchy& hierarchy, const PruneContext& ctx, const Bar& bar,
                               std::vector<DetectionEvent>& events) const;

    void remove(Hierarchy& hierarchy, LegId id, EventType type,
                std::optional<PruneReason> reason, const std::string& explanation,
                const Bar& bar, std::vector<DetectionEvent>& events) const;

    DetectionConfig config_;
};
