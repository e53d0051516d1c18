#include "swing.hpp"
#include <cmath>
#include <stdexcept>

std::string to_string(SwingStatus status) {
    return status == SwingStatus::Active ? "active" : "invalidated";
}

double Swing::range() const {
    return std::fabs(pivot_price - origin_price);
}

double Swing::level_price(double ratio) const {
    for (const auto& level : levels) {
        if (level.ratio == ratio) return level.price;
    }
    throw std::out_of_range("Swing has no level " + std::to_string(ratio));
}

const std::vector<double>& SwingFormer::fib_ratios() {
    static const std::vector<double> ratios = {0.382, 0.5, 0.618, 1.0, 1.382, 1.618, 2.0};
    return ratios;
}

Swing SwingFormer::form(const Leg& leg, const Bar& bar) {
    Swing swing;
    swing.leg_id = leg.id;
    swing.direction = leg.direction;
    swing.origin_price = leg.origin_price;
    swing.origin_index = leg.origin_index;
    swing.pivot_price = leg.pivot_price;
    swing.pivot_index = leg.pivot_index;
    swing.formed_index = bar.index;
    swing.formation_price = bar.close;

    ReferenceFrame frame = leg.frame();
    for (double ratio : fib_ratios()) {
        swing.levels.push_back({ratio, frame.price(ratio)});
    }

    mirror_status(swing, leg);
    return swing;
}

void SwingFormer::mirror_status(Swing& swing, const Leg& leg) {
    swing.status = leg.status == LegStatus::Active ? SwingStatus::Active : SwingStatus::Invalidated;
}

nlohmann::json Swing::to_json() const {
    nlohmann::json lv = nlohmann::json::array();
    for (const auto& level : levels) {
        lv.push_back({{"ratio", level.ratio}, {"price", level.price}});
    }
    return {
        {"leg_id", leg_id},
        {"direction", ::to_string(direction)},
        {"origin_price", origin_price},
        {"origin_index", origin_index},
        {"pivot_price", pivot_price},
        {"pivot_index", pivot_index},
        {"formed_index", formed_index},
        {"formation_price", formation_price},
        {"status", ::to_string(status)},
        {"levels", lv}
    };
}

Swing Swing::from_json(const nlohmann::json& j) {
    Swing swing;
    swing.leg_id = j.at("leg_id").get<LegId>();
    swing.direction = direction_from_string(j.at("direction").get<std::string>());
    swing.origin_price = j.at("origin_price").get<double>();
    swing.origin_index = j.at("origin_index").get<int64_t>();
    swing.pivot_price = j.at("pivot_price").get<double>();
    swing.pivot_index = j.at("pivot_index").get<int64_t>();
    swing.formed_index = j.at("formed_index").get<int64_t>();
    swing.formation_price = j.at("formation_price").get<double>();
    swing.status = j.at("status").get<std::string>() == "active"
        ? SwingStatus::Active : SwingStatus::Invalidated;
    for (const auto& level : j.at("levels")) {
        swing.levels.push_back({level.at("ratio").get<double>(), level.at("price").get<double>()});
    }
    return swing;
}
