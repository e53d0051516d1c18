#pragma once

#include "leg.hpp"
#include <string>
#include <cstdlib>
#include <nlohmann/json.hpp>

struct DirectionConfig {
    double formation_threshold = 0.382;
    double self_separation = 0.10;
    double parent_child_separation = 0.10;

    // Top fraction of live leg ranges treated as big swings
    double big_swing_threshold = 0.10;
    double big_swing_price_tolerance = 0.15;  // wick
    double big_swing_close_tolerance = 0.10;  // close
    double child_swing_tolerance = 0.10;

    double engulfment_threshold = 0.236;

    nlohmann::json to_json() const;
    void merge_json(const nlohmann::json& j);
    void validate(const std::string& name) const;
};

struct DetectionConfig {
    DirectionConfig bull;
    DirectionConfig bear;

    int lookback = 2;
    int max_pair_distance = 500;  // bars
    int max_legs_per_turn = 3;
    double proximity_tolerance = 0.05;
    double stale_extension_threshold = 3.0;
    bool enable_inner_structure_prune = false;
    bool check_invariants = false;

    const DirectionConfig& for_direction(Direction direction) const;

    static DetectionConfig from_env();
    static DetectionConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
    void validate() const;

private:
    static DirectionConfig direction_from_env(const std::string& prefix);
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);

    friend struct ServiceConfig;
};

struct ServiceConfig {
    // Redis
    std::string redis_url;
    std::string stream_bars;
    std::string stream_events;
    std::string consumer_group;
    std::string consumer_name;
    std::string snapshot_key;
    int snapshot_interval;  // bars between snapshot writes

    // Detection parameters overlay, JSON file
    std::string config_file;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static ServiceConfig from_env();
    void validate() const;
};
