#pragma once

#include "bar.hpp"
#include <cstdint>
#include <deque>
#include <vector>
#include <nlohmann/json.hpp>

enum class PointType {
    High,
    Low
};

// Confirmed local extreme waiting to seed a leg as its origin.
struct SwingPoint {
    PointType type = PointType::High;
    double price = 0.0;
    int64_t index = 0;
    // Index of the last opposite-type point before this one, -1 if none
    int64_t turn_start = -1;
    // Extremes of every bar after this point, up to the current bar
    double max_high_after = 0.0;
    double min_low_after = 0.0;
    bool consumed = false;

    nlohmann::json to_json() const;
    static SwingPoint from_json(const nlohmann::json& j);
};

// Confirms swing highs and lows `lookback` bars after the fact and keeps
// the unconsumed ones within `max_pair_distance` bars as pairing candidates.
class SwingPointTracker {
public:
    SwingPointTracker(int lookback, int max_pair_distance);

    // Feed the current bar; returns points confirmed on it (high before low)
    std::vector<SwingPoint> observe(const Bar& bar);

    // Opposite-type points that `pivot` can close into a leg: unconsumed,
    // within distance, with no later bar beyond either end. Most extreme first.
    std::vector<SwingPoint> candidates_for(const SwingPoint& pivot) const;

    void consume(PointType type, int64_t index);

    const std::deque<Bar>& window() const { return window_; }
    const std::deque<SwingPoint>& points() const { return points_; }
    int64_t last_high_index() const { return last_high_index_; }
    int64_t last_low_index() const { return last_low_index_; }

    void restore(std::vector<Bar> window, std::vector<SwingPoint> points,
                 int64_t last_high_index, int64_t last_low_index);

private:
    void expire(int64_t current_index);
    bool is_window_high(size_t pos) const;
    bool is_window_low(size_t pos) const;
    SwingPoint make_point(PointType type, size_t pos) const;

    int lookback_;
    int max_pair_distance_;
    std::deque<Bar> window_;
    std::deque<SwingPoint> points_;
    int64_t last_high_index_ = -1;
    int64_t last_low_index_ = -1;
};
