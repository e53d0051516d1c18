#include "range_distribution.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

RangeDistribution::RangeDistribution(std::vector<double> values)
    : values_(std::move(values)) {
    std::sort(values_.begin(), values_.end());
}

void RangeDistribution::insert(double value) {
    auto it = std::upper_bound(values_.begin(), values_.end(), value);
    values_.insert(it, value);
}

void RangeDistribution::erase(double value) {
    auto it = std::lower_bound(values_.begin(), values_.end(), value);
    if (it == values_.end() || *it != value) {
        throw InvariantError("Range distribution has no entry " + std::to_string(value));
    }
    values_.erase(it);
}

void RangeDistribution::replace(double old_value, double new_value) {
    erase(old_value);
    insert(new_value);
}

double RangeDistribution::percentile_rank(double value) const {
    if (values_.empty()) return 0.0;
    auto position = std::lower_bound(values_.begin(), values_.end(), value) - values_.begin();
    return static_cast<double>(position) / static_cast<double>(values_.size()) * 100.0;
}

double RangeDistribution::top_fraction_cutoff(double fraction) const {
    if (values_.empty() || fraction <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    double n = static_cast<double>(values_.size());
    auto idx = static_cast<size_t>(std::floor((1.0 - fraction) * n));
    idx = std::min(idx, values_.size() - 1);
    return values_[idx];
}

bool RangeDistribution::in_top_fraction(double value, double fraction) const {
    return value >= top_fraction_cutoff(fraction);
}
