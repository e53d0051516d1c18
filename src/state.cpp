#include "state.hpp"
#include "errors.hpp"
#include <string>

nlohmann::json DetectorState::to_json() const {
    nlohmann::json j;
    j["version"] = kVersion;

    j["legs"] = nlohmann::json::array();
    for (const auto& [id, leg] : legs) {
        j["legs"].push_back(leg.to_json());
    }
    j["next_leg_id"] = next_leg_id;

    j["swings"] = nlohmann::json::array();
    for (const auto& [id, swing] : swings) {
        j["swings"].push_back(swing.to_json());
    }

    j["bar_window"] = nlohmann::json::array();
    for (const auto& bar : bar_window) {
        j["bar_window"].push_back(bar.to_json());
    }
    j["swing_points"] = nlohmann::json::array();
    for (const auto& p : swing_points) {
        j["swing_points"].push_back(p.to_json());
    }
    j["last_high_index"] = last_high_index;
    j["last_low_index"] = last_low_index;

    j["formed_impulses"] = formed_impulses;
    j["last_bar_index"] = last_bar_index;
    j["last_timestamp"] = last_timestamp_ms ? nlohmann::json(*last_timestamp_ms)
                                            : nlohmann::json(nullptr);
    return j;
}

DetectorState DetectorState::from_json(const nlohmann::json& j) {
    DetectorState state;
    try {
        int version = j.at("version").get<int>();
        if (version != kVersion) {
            throw SnapshotError("Unsupported snapshot version " + std::to_string(version));
        }

        for (const auto& lj : j.at("legs")) {
            Leg leg = Leg::from_json(lj);
            LegId id = leg.id;
            state.legs.emplace(id, std::move(leg));
        }
        state.next_leg_id = j.at("next_leg_id").get<LegId>();

        for (const auto& sj : j.at("swings")) {
            Swing swing = Swing::from_json(sj);
            LegId id = swing.leg_id;
            state.swings.emplace(id, std::move(swing));
        }

        for (const auto& bj : j.at("bar_window")) {
            state.bar_window.push_back(Bar::from_json(bj));
        }
        for (const auto& pj : j.at("swing_points")) {
            state.swing_points.push_back(SwingPoint::from_json(pj));
        }
        state.last_high_index = j.at("last_high_index").get<int64_t>();
        state.last_low_index = j.at("last_low_index").get<int64_t>();

        state.formed_impulses = j.at("formed_impulses").get<std::vector<double>>();
        state.last_bar_index = j.at("last_bar_index").get<int64_t>();
        if (!j.at("last_timestamp").is_null()) {
            state.last_timestamp_ms = j.at("last_timestamp").get<int64_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("Malformed snapshot: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotError(std::string("Malformed snapshot: ") + e.what());
    }
    return state;
}
