#pragma once

#include <cstddef>
#include <vector>

// Sorted multiset of values with percentile queries. Used for live leg
// ranges (big swing classification) and for the impulses of formed legs.
class RangeDistribution {
public:
    RangeDistribution() = default;
    explicit RangeDistribution(std::vector<double> values);

    void insert(double value);
    // Throws InvariantError if the value is not present
    void erase(double value);
    void replace(double old_value, double new_value);

    // Share of values strictly below `value`, 0-100
    double percentile_rank(double value) const;

    // Smallest value that still belongs to the top `fraction` of the population
    double top_fraction_cutoff(double fraction) const;
    bool in_top_fraction(double value, double fraction) const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const std::vector<double>& values() const { return values_; }

private:
    std::vector<double> values_;
};
