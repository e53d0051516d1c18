#include "swing_points.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

nlohmann::json SwingPoint::to_json() const {
    return {
        {"type", type == PointType::High ? "high" : "low"},
        {"price", price},
        {"index", index},
        {"turn_start", turn_start},
        {"max_high_after", max_high_after},
        {"min_low_after", min_low_after},
        {"consumed", consumed}
    };
}

SwingPoint SwingPoint::from_json(const nlohmann::json& j) {
    SwingPoint p;
    p.type = j.at("type").get<std::string>() == "high" ? PointType::High : PointType::Low;
    p.price = j.at("price").get<double>();
    p.index = j.at("index").get<int64_t>();
    p.turn_start = j.at("turn_start").get<int64_t>();
    p.max_high_after = j.at("max_high_after").get<double>();
    p.min_low_after = j.at("min_low_after").get<double>();
    p.consumed = j.at("consumed").get<bool>();
    return p;
}

SwingPointTracker::SwingPointTracker(int lookback, int max_pair_distance)
    : lookback_(lookback), max_pair_distance_(max_pair_distance) {}

bool SwingPointTracker::is_window_high(size_t pos) const {
    double h = window_[pos].high;
    for (size_t i = 0; i < window_.size(); i++) {
        if (i < pos && window_[i].high >= h) return false;
        if (i > pos && window_[i].high > h) return false;
    }
    return true;
}

bool SwingPointTracker::is_window_low(size_t pos) const {
    double l = window_[pos].low;
    for (size_t i = 0; i < window_.size(); i++) {
        if (i < pos && window_[i].low <= l) return false;
        if (i > pos && window_[i].low < l) return false;
    }
    return true;
}

SwingPoint SwingPointTracker::make_point(PointType type, size_t pos) const {
    const Bar& bar = window_[pos];
    SwingPoint p;
    p.type = type;
    p.price = type == PointType::High ? bar.high : bar.low;
    p.index = bar.index;
    p.turn_start = type == PointType::High ? last_low_index_ : last_high_index_;
    p.max_high_after = window_[pos + 1].high;
    p.min_low_after = window_[pos + 1].low;
    for (size_t i = pos + 1; i < window_.size(); i++) {
        p.max_high_after = std::max(p.max_high_after, window_[i].high);
        p.min_low_after = std::min(p.min_low_after, window_[i].low);
    }
    return p;
}

std::vector<SwingPoint> SwingPointTracker::observe(const Bar& bar) {
    for (auto& p : points_) {
        p.max_high_after = std::max(p.max_high_after, bar.high);
        p.min_low_after = std::min(p.min_low_after, bar.low);
    }

    window_.push_back(bar);
    size_t full = static_cast<size_t>(2 * lookback_ + 1);
    while (window_.size() > full) {
        window_.pop_front();
    }

    std::vector<SwingPoint> confirmed;
    if (window_.size() == full) {
        size_t pos = static_cast<size_t>(lookback_);
        if (is_window_high(pos)) {
            confirmed.push_back(make_point(PointType::High, pos));
            last_high_index_ = window_[pos].index;
        }
        if (is_window_low(pos)) {
            confirmed.push_back(make_point(PointType::Low, pos));
            last_low_index_ = window_[pos].index;
        }
        for (const auto& p : confirmed) {
            points_.push_back(p);
            spdlog::debug("Confirmed swing {} {} at bar {}",
                          p.type == PointType::High ? "high" : "low", p.price, p.index);
        }
    }

    expire(bar.index);
    return confirmed;
}

std::vector<SwingPoint> SwingPointTracker::candidates_for(const SwingPoint& pivot) const {
    std::vector<SwingPoint> out;
    for (const auto& p : points_) {
        if (p.type == pivot.type || p.consumed) continue;
        if (p.index >= pivot.index) continue;
        if (pivot.index - p.index > max_pair_distance_) continue;

        if (pivot.type == PointType::High) {
            // Bull: origin low never undercut, pivot high never exceeded since origin
            if (pivot.price <= p.price) continue;
            if (p.min_low_after < p.price || p.max_high_after > pivot.price) continue;
        } else {
            if (pivot.price >= p.price) continue;
            if (p.max_high_after > p.price || p.min_low_after < pivot.price) continue;
        }
        out.push_back(p);
    }

    std::sort(out.begin(), out.end(), [&pivot](const SwingPoint& a, const SwingPoint& b) {
        if (a.price != b.price) {
            return pivot.type == PointType::High ? a.price < b.price : a.price > b.price;
        }
        return a.index < b.index;
    });
    return out;
}

void SwingPointTracker::consume(PointType type, int64_t index) {
    for (auto& p : points_) {
        if (p.type == type && p.index == index) {
            p.consumed = true;
        }
    }
}

void SwingPointTracker::expire(int64_t current_index) {
    auto dead = [this, current_index](const SwingPoint& p) {
        if (p.consumed) return true;
        if (current_index - p.index > max_pair_distance_) return true;
        // An undercut origin can never pass protection again
        return p.type == PointType::Low ? p.min_low_after < p.price : p.max_high_after > p.price;
    };
    points_.erase(std::remove_if(points_.begin(), points_.end(), dead), points_.end());
}

void SwingPointTracker::restore(std::vector<Bar> window, std::vector<SwingPoint> points,
                                int64_t last_high_index, int64_t last_low_index) {
    window_.assign(window.begin(), window.end());
    points_.assign(points.begin(), points.end());
    last_high_index_ = last_high_index;
    last_low_index_ = last_low_index;
}
