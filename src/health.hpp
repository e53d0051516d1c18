#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>

class HealthMonitor {
public:
    void set_redis(bool ok);
    void set_loop_status(const std::string& status);
    void record_bar(int64_t bar_index, size_t live_legs, size_t swings);
    void record_snapshot();

    nlohmann::json to_json() const;
    bool is_ok() const;

private:
    mutable std::mutex mutex_;
    bool redis_ok_ = false;
    std::string loop_status_ = "starting";
    int64_t last_bar_index_ = -1;
    size_t live_legs_ = 0;
    size_t swings_ = 0;
    std::string last_bar_ts_;
    std::string last_snapshot_ts_;
};
