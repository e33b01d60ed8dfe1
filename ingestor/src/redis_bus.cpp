#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisBus::publish_event(const std::string& stream, const std::string& type,
                             const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["type"] = type;
        fields["ts"] = util::current_iso8601();
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish {} event: {}", type, e.what());
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
