#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

struct Bar {
    int64_t timestamp_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t index = -1;  // assigned by the detector on ingestion

    // Throws BarOrderError on non-finite prices or high/low that do not bracket open/close
    void validate() const;

    nlohmann::json to_json() const;
    static Bar from_json(const nlohmann::json& j);
};
