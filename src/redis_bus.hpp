#pragma once
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);
    
    void create_consumer_group(const std::string& stream, const std::string& group);
    std::vector<std::pair<std::string, nlohmann::json>>
        read_bars(const std::string& stream, const std::string& group,
                  const std::string& consumer, int count, int block_ms);
    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);
    void publish_event(const std::string& stream, const nlohmann::json& data);

    std::optional<std::string> load_snapshot(const std::string& key);
    bool store_snapshot(const std::string& key, const std::string& payload);

    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
