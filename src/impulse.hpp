#pragma once

#include "range_distribution.hpp"
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

// Running raw moments of per-bar contributions. Constant space per leg.
struct ImpulseMoments {
    int64_t n = 0;
    double sum_x = 0.0;
    double sum_x2 = 0.0;
    double sum_x3 = 0.0;

    void add(double contribution);

    // Sigmoid of Fisher skewness, 0-100. Empty below three samples;
    // 50 when every contribution is the same.
    std::optional<double> spikiness() const;

    nlohmann::json to_json() const;
    static ImpulseMoments from_json(const nlohmann::json& j);
};

// Percentile of `impulse` among formed-leg impulses, empty if none formed yet
std::optional<double> impulsiveness(double impulse, const RangeDistribution& formed_impulses);
