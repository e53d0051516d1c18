#pragma once

#include "config.hpp"
#include "hierarchy.hpp"
#include "swing.hpp"
#include <map>

// Development-time structural checks run after each bar. Throws
// InvariantError on the first violation found.
class InvariantChecker {
public:
    void check(const Hierarchy& hierarchy,
               const std::map<LegId, Swing>& swings,
               const DetectionConfig& config);

private:
    struct Anchors {
        double origin_price;
        int64_t origin_index;
        double pivot_price;
        bool breached;
    };

    void check_links(const Hierarchy& hierarchy) const;
    void check_anchors(const Hierarchy& hierarchy);

    std::map<LegId, Anchors> seen_;
};
