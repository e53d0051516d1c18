#include "impulse.hpp"
#include <cmath>

void ImpulseMoments::add(double contribution) {
    n += 1;
    sum_x += contribution;
    sum_x2 += contribution * contribution;
    sum_x3 += contribution * contribution * contribution;
}

std::optional<double> ImpulseMoments::spikiness() const {
    if (n < 3) return std::nullopt;

    double count = static_cast<double>(n);
    double mean = sum_x / count;
    double variance = (sum_x2 / count) - mean * mean;
    if (variance < 1e-10) {
        return 50.0;
    }

    double std_dev = std::sqrt(variance);
    double third_moment = (sum_x3 / count) - 3.0 * mean * (sum_x2 / count) + 2.0 * mean * mean * mean;
    double skewness = third_moment / (std_dev * std_dev * std_dev);

    return 100.0 / (1.0 + std::exp(-skewness));
}

nlohmann::json ImpulseMoments::to_json() const {
    return {{"n", n}, {"sum_x", sum_x}, {"sum_x2", sum_x2}, {"sum_x3", sum_x3}};
}

ImpulseMoments ImpulseMoments::from_json(const nlohmann::json& j) {
    ImpulseMoments m;
    m.n = j.at("n").get<int64_t>();
    m.sum_x = j.at("sum_x").get<double>();
    m.sum_x2 = j.at("sum_x2").get<double>();
    m.sum_x3 = j.at("sum_x3").get<double>();
    return m;
}

std::optional<double> impulsiveness(double impulse, const RangeDistribution& formed_impulses) {
    if (formed_impulses.empty()) return std::nullopt;
    return formed_impulses.percentile_rank(impulse);
}
