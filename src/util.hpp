#pragma once

#include <string>

namespace util {
    // UTC wall clock, second resolution
    std::string current_iso8601();
    // Fixed two-decimal rendering used in event explanations
    std::string format_price(double price);
}
