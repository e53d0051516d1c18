#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "events.hpp"
#include "hierarchy.hpp"
#include "invariants.hpp"
#include "pruner.hpp"
#include "range_distribution.hpp"
#include "state.hpp"
#include "swing.hpp"
#include "swing_points.hpp"
#include <map>
#include <optional>
#include <vector>

// Incremental leg detector. One bar in, events out; the same call serves
// historical calibration and live replay.
class Detector {
public:
    // Validates the configuration; throws ConfigError
    explicit Detector(const DetectionConfig& config);

    static Detector restore(const DetectorState& state, const DetectionConfig& config);

    // Bars must arrive with strictly increasing timestamps. A rejected bar
    // throws BarOrderError and leaves the detector untouched.
    std::vector<DetectionEvent> process_bar(Bar bar);

    DetectorState snapshot() const;

    const Hierarchy& hierarchy() const { return hierarchy_; }
    const std::map<LegId, Swing>& swings() const { return swings_; }
    const RangeDistribution& formed_impulses() const { return formed_impulses_; }
    const DetectionConfig& config() const { return config_; }
    int64_t last_bar_index() const { return last_bar_index_; }
    std::optional<int64_t> last_timestamp_ms() const { return last_timestamp_ms_; }

private:
    struct BreachTolerance {
        bool check_touch;
        double touch;
        double close;
    };

    void validate_order(const Bar& bar) const;

    void update_moments(const Bar& bar);
    void extend_legs(const Bar& bar, std::vector<DetectionEvent>& events);
    std::vector<LegId> confirm_and_pair(const Bar& bar, std::vector<DetectionEvent>& events);
    void pair_into_legs(const SwingPoint& pivot, const Bar& bar,
                        std::vector<LegId>& created, std::vector<DetectionEvent>& events);
    std::optional<LegId> find_parent(Direction direction, double origin_price,
                                     int64_t origin_index) const;
    double counter_trend_range_at(Direction direction, double price, int64_t index) const;
    std::vector<LegId> track_breaches(const Bar& bar, std::vector<DetectionEvent>& events);
    BreachTolerance tolerance_for(const Leg& leg) const;
    bool is_big(const Leg& leg) const;
    void check_formation(const Bar& bar, std::vector<DetectionEvent>& events);
    void drop_swings(const std::vector<DetectionEvent>& removals);
    void update_impulsiveness();

    DetectionConfig config_;
    Pruner pruner_;
    Hierarchy hierarchy_;
    SwingPointTracker points_;
    std::map<LegId, Swing> swings_;
    RangeDistribution formed_impulses_;
    int64_t last_bar_index_ = -1;
    std::optional<int64_t> last_timestamp_ms_;
    InvariantChecker invariants_;
};
