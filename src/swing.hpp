#pragma once

#include "bar.hpp"
#include "leg.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SwingStatus {
    Active,
    Invalidated
};

std::string to_string(SwingStatus status);

struct FibLevel {
    double ratio;
    double price;
};

// Immutable record of a formed leg. Holds its own copy of the anchors so it
// outlives the leg's invalidation; only `status` follows the leg afterwards.
struct Swing {
    LegId leg_id = 0;
    Direction direction = Direction::Bull;
    double origin_price = 0.0;
    int64_t origin_index = 0;
    double pivot_price = 0.0;
    int64_t pivot_index = 0;
    int64_t formed_index = 0;
    double formation_price = 0.0;  // close of the forming bar
    SwingStatus status = SwingStatus::Active;
    std::vector<FibLevel> levels;

    double range() const;
    double level_price(double ratio) const;

    nlohmann::json to_json() const;
    static Swing from_json(const nlohmann::json& j);
};

class SwingFormer {
public:
    static Swing form(const Leg& leg, const Bar& bar);
    static void mirror_status(Swing& swing, const Leg& leg);
    static const std::vector<double>& fib_ratios();
};
