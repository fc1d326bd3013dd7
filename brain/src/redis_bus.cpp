#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, const std::string& alerts_stream)
    : alerts_stream_(alerts_stream) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {} (alerts -> {})", redis_url, alerts_stream_);
}

void RedisBus::publish(const nlohmann::json& alert) {
    publish_to_stream(alerts_stream_, alert);
}

void RedisBus::publish_to_stream(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["type"] = data.value("type", "alert");
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
        spdlog::debug("Published {} to {}", fields["type"], stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Redis ping failed: {}", e.what());
        return false;
    }
}
