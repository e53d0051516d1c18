#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <utility>
#include <unordered_map>

namespace {

using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

} // namespace

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        // Start from the beginning so bars queued before the first run are not lost
        redis_->xgroup_create(stream, group, "0", true);
        spdlog::info("Created consumer group {} on {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_bars(const std::string& stream, const std::string& group,
                    const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;
    
    try {
        std::unordered_map<std::string, ItemStream> items;
        redis_->xreadgroup(group, consumer, stream, ">",
                           std::chrono::milliseconds(block_ms), count,
                           std::inserter(items, items.end()));
        
        for (const auto& [_, item_stream] : items) {
            for (const auto& item : item_stream) {
                if (!item.second) continue;
                auto it = item.second->find("data");
                if (it != item.second->end()) {
                    // Unparseable payloads still go back so the caller can ack them
                    auto payload = nlohmann::json::parse(it->second, nullptr, false);
                    results.emplace_back(item.first, std::move(payload));
                } else {
                    spdlog::warn("Bar message {} has no data field", item.first);
                    results.emplace_back(item.first, nlohmann::json());
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to read bars: {}", e.what());
    }
    
    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack: {}", e.what());
    }
}

void RedisBus::publish_event(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish event: {}", e.what());
    }
}

std::optional<std::string> RedisBus::load_snapshot(const std::string& key) {
    auto value = redis_->get(key);
    if (!value) return std::nullopt;
    return *value;
}

bool RedisBus::store_snapshot(const std::string& key, const std::string& payload) {
    try {
        redis_->set(key, payload);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to store snapshot under {}: {}", key, e.what());
        return false;
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
