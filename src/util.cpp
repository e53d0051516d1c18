#include "util.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

std::string format_price(double price) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << price;
    return ss.str();
}

} // namespace util
