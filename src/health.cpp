#include "health.hpp"
#include "util.hpp"

void HealthMonitor::set_redis(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_ok_ = ok;
}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::record_bar(int64_t bar_index, size_t live_legs, size_t swings) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_bar_index_ = bar_index;
    live_legs_ = live_legs;
    swings_ = swings;
    last_bar_ts_ = util::current_iso8601();
}

void HealthMonitor::record_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_snapshot_ts_ = util::current_iso8601();
}

nlohmann::json HealthMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"ok", redis_ok_ && loop_status_ == "running"},
        {"redis", redis_ok_},
        {"loop", loop_status_},
        {"last_bar_index", last_bar_index_},
        {"live_legs", live_legs_},
        {"swings", swings_},
        {"last_bar_ts", last_bar_ts_},
        {"last_snapshot_ts", last_snapshot_ts_}
    };
}

bool HealthMonitor::is_ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_ok_ && loop_status_ == "running";
}
