#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Stream entries carry their JSON payload in a single "data" field
class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    void create_consumer_group(const std::string& stream, const std::string& group);
    std::vector<std::pair<std::string, nlohmann::json>>
        read_entries(const std::string& stream, const std::string& group,
                     const std::string& consumer, int count, int block_ms);
    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);

    // Returns false (after logging) when the entry could not be written
    bool publish(const std::string& stream, const nlohmann::json& data);

    // nullopt when Redis is unreachable
    std::optional<std::map<std::string, std::string>> read_hash(const std::string& key);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
