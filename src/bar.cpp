#include "bar.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

void Bar::validate() const {
    if (!std::isfinite(open) || !std::isfinite(high) ||
        !std::isfinite(low) || !std::isfinite(close)) {
        throw BarOrderError("Bar at " + std::to_string(timestamp_ms) + " has non-finite prices");
    }
    if (high < low) {
        throw BarOrderError("Bar at " + std::to_string(timestamp_ms) + " has high below low");
    }
    if (open > high || open < low || close > high || close < low) {
        throw BarOrderError("Bar at " + std::to_string(timestamp_ms) +
                            " has open/close outside its range");
    }
}

nlohmann::json Bar::to_json() const {
    return {
        {"timestamp", timestamp_ms},
        {"open", open},
        {"high", high},
        {"low", low},
        {"close", close},
        {"index", index}
    };
}

Bar Bar::from_json(const nlohmann::json& j) {
    Bar bar;
    bar.timestamp_ms = j.at("timestamp").get<int64_t>();
    bar.open = j.at("open").get<double>();
    bar.high = j.at("high").get<double>();
    bar.low = j.at("low").get<double>();
    bar.close = j.at("close").get<double>();
    bar.index = j.value("index", static_cast<int64_t>(-1));
    return bar;
}
