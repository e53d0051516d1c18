#include "config.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string DetectionConfig::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int DetectionConfig::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double DetectionConfig::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool DetectionConfig::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

DirectionConfig DetectionConfig::direction_from_env(const std::string& prefix) {
    DirectionConfig d;
    auto key = [&prefix](const char* suffix) { return prefix + suffix; };

    d.formation_threshold = get_env_double(key("FORMATION_THRESHOLD").c_str(), d.formation_threshold);
    d.self_separation = get_env_double(key("SELF_SEPARATION").c_str(), d.self_separation);
    d.parent_child_separation =
        get_env_double(key("PARENT_CHILD_SEPARATION").c_str(), d.parent_child_separation);
    d.big_swing_threshold = get_env_double(key("BIG_SWING_THRESHOLD").c_str(), d.big_swing_threshold);
    d.big_swing_price_tolerance =
        get_env_double(key("BIG_SWING_PRICE_TOLERANCE").c_str(), d.big_swing_price_tolerance);
    d.big_swing_close_tolerance =
        get_env_double(key("BIG_SWING_CLOSE_TOLERANCE").c_str(), d.big_swing_close_tolerance);
    d.child_swing_tolerance =
        get_env_double(key("CHILD_SWING_TOLERANCE").c_str(), d.child_swing_tolerance);
    d.engulfment_threshold =
        get_env_double(key("ENGULFMENT_THRESHOLD").c_str(), d.engulfment_threshold);

    return d;
}

DetectionConfig DetectionConfig::from_env() {
    DetectionConfig cfg;

    cfg.bull = direction_from_env("SWING_BULL_");
    cfg.bear = direction_from_env("SWING_BEAR_");

    cfg.lookback = get_env_int("SWING_LOOKBACK", cfg.lookback);
    cfg.max_pair_distance = get_env_int("SWING_MAX_PAIR_DISTANCE", cfg.max_pair_distance);
    cfg.max_legs_per_turn = get_env_int("SWING_MAX_LEGS_PER_TURN", cfg.max_legs_per_turn);
    cfg.proximity_tolerance = get_env_double("SWING_PROXIMITY_TOLERANCE", cfg.proximity_tolerance);
    cfg.stale_extension_threshold =
        get_env_double("SWING_STALE_EXTENSION_THRESHOLD", cfg.stale_extension_threshold);
    cfg.enable_inner_structure_prune =
        get_env_bool("SWING_INNER_STRUCTURE_PRUNE", cfg.enable_inner_structure_prune);
    cfg.check_invariants = get_env_bool("SWING_CHECK_INVARIANTS", cfg.check_invariants);

    return cfg;
}

const DirectionConfig& DetectionConfig::for_direction(Direction direction) const {
    return direction == Direction::Bull ? bull : bear;
}

nlohmann::json DirectionConfig::to_json() const {
    return {
        {"formation_threshold", formation_threshold},
        {"self_separation", self_separation},
        {"parent_child_separation", parent_child_separation},
        {"big_swing_threshold", big_swing_threshold},
        {"big_swing_price_tolerance", big_swing_price_tolerance},
        {"big_swing_close_tolerance", big_swing_close_tolerance},
        {"child_swing_tolerance", child_swing_tolerance},
        {"engulfment_threshold", engulfment_threshold}
    };
}

void DirectionConfig::merge_json(const nlohmann::json& j) {
    formation_threshold = j.value("formation_threshold", formation_threshold);
    self_separation = j.value("self_separation", self_separation);
    parent_child_separation = j.value("parent_child_separation", parent_child_separation);
    big_swing_threshold = j.value("big_swing_threshold", big_swing_threshold);
    big_swing_price_tolerance = j.value("big_swing_price_tolerance", big_swing_price_tolerance);
    big_swing_close_tolerance = j.value("big_swing_close_tolerance", big_swing_close_tolerance);
    child_swing_tolerance = j.value("child_swing_tolerance", child_swing_tolerance);
    engulfment_threshold = j.value("engulfment_threshold", engulfment_threshold);
}

DetectionConfig DetectionConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Detection config must be a JSON object");
    }

    DetectionConfig cfg;
    try {
        if (j.contains("bull")) cfg.bull.merge_json(j.at("bull"));
        if (j.contains("bear")) cfg.bear.merge_json(j.at("bear"));

        cfg.lookback = j.value("lookback", cfg.lookback);
        cfg.max_pair_distance = j.value("max_pair_distance", cfg.max_pair_distance);
        cfg.max_legs_per_turn = j.value("max_legs_per_turn", cfg.max_legs_per_turn);
        cfg.proximity_tolerance = j.value("proximity_tolerance", cfg.proximity_tolerance);
        cfg.stale_extension_threshold =
            j.value("stale_extension_threshold", cfg.stale_extension_threshold);
        cfg.enable_inner_structure_prune =
            j.value("enable_inner_structure_prune", cfg.enable_inner_structure_prune);
        cfg.check_invariants = j.value("check_invariants", cfg.check_invariants);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed detection config: ") + e.what());
    }
    return cfg;
}

nlohmann::json DetectionConfig::to_json() const {
    return {
        {"bull", bull.to_json()},
        {"bear", bear.to_json()},
        {"lookback", lookback},
        {"max_pair_distance", max_pair_distance},
        {"max_legs_per_turn", max_legs_per_turn},
        {"proximity_tolerance", proximity_tolerance},
        {"stale_extension_threshold", stale_extension_threshold},
        {"enable_inner_structure_prune", enable_inner_structure_prune},
        {"check_invariants", check_invariants}
    };
}

void DirectionConfig::validate(const std::string& name) const {
    if (!(formation_threshold > 0.0 && formation_threshold <= 1.0)) {
        throw ConfigError(name + ".formation_threshold must be in (0, 1]");
    }
    if (self_separation < 0.0 || parent_child_separation < 0.0) {
        throw ConfigError(name + " separation minimums must be non-negative");
    }
    if (big_swing_threshold < 0.0 || big_swing_threshold > 1.0) {
        throw ConfigError(name + ".big_swing_threshold must be in [0, 1]");
    }
    if (big_swing_price_tolerance < 0.0 || big_swing_close_tolerance < 0.0 ||
        child_swing_tolerance < 0.0) {
        throw ConfigError(name + " invalidation tolerances must be non-negative");
    }
    if (engulfment_threshold < 0.0) {
        throw ConfigError(name + ".engulfment_threshold must be non-negative");
    }
}

void DetectionConfig::validate() const {
    bull.validate("bull");
    bear.validate("bear");

    if (lookback < 1) {
        throw ConfigError("lookback must be at least 1");
    }
    if (max_pair_distance < 1) {
        throw ConfigError("max_pair_distance must be at least 1");
    }
    if (max_legs_per_turn < 1) {
        throw ConfigError("max_legs_per_turn must be at least 1");
    }
    if (proximity_tolerance < 0.0) {
        throw ConfigError("proximity_tolerance must be non-negative");
    }
    if (stale_extension_threshold <= 0.0) {
        throw ConfigError("stale_extension_threshold must be positive");
    }

    spdlog::info("Detection configuration validated");
    spdlog::info("  Lookback: {}, pair distance: {} bars", lookback, max_pair_distance);
    spdlog::info("  Formation: bull={}, bear={}", bull.formation_threshold, bear.formation_threshold);
    spdlog::info("  Engulfment: bull={}, bear={}", bull.engulfment_threshold, bear.engulfment_threshold);
    spdlog::info("  Turn limit: {}, proximity: {}, inner structure: {}",
                 max_legs_per_turn, proximity_tolerance, enable_inner_structure_prune);
}

ServiceConfig ServiceConfig::from_env() {
    ServiceConfig cfg;

    cfg.redis_url = DetectionConfig::get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_bars = DetectionConfig::get_env("STREAM_BARS", "swing.bars");
    cfg.stream_events = DetectionConfig::get_env("STREAM_EVENTS", "swing.events");
    cfg.consumer_group = DetectionConfig::get_env("CONSUMER_GROUP", "swingdag_group");
    cfg.consumer_name = DetectionConfig::get_env("CONSUMER_NAME", "swingdag_consumer");
    cfg.snapshot_key = DetectionConfig::get_env("SNAPSHOT_KEY", "swing.snapshot");
    cfg.snapshot_interval = DetectionConfig::get_env_int("SNAPSHOT_INTERVAL", 500);

    cfg.config_file = DetectionConfig::get_env("DETECTION_CONFIG_FILE");

    cfg.listen_addr = DetectionConfig::get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = DetectionConfig::get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = DetectionConfig::get_env("SERVICE_NAME", "swingdag");
    cfg.log_level = DetectionConfig::get_env("LOG_LEVEL", "info");

    return cfg;
}

void ServiceConfig::validate() const {
    if (redis_url.empty()) {
        throw ConfigError("REDIS_URL is required");
    }
    if (snapshot_interval < 1) {
        throw ConfigError("SNAPSHOT_INTERVAL must be at least 1");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw ConfigError("LISTEN_PORT out of range");
    }

    spdlog::info("Service configuration validated");
    spdlog::info("  Streams: bars={}, events={}", stream_bars, stream_events);
    spdlog::info("  Snapshot: key={}, every {} bars", snapshot_key, snapshot_interval);
}
