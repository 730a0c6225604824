#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

bool RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();

        redis_->xadd(stream, "*", fields.begin(), fields.end());
        spdlog::debug("Published to {}: {}", stream, data.value("kind", "message"));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
        return false;
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Redis ping failed: {}", e.what());
        return false;
    }
}

RedisAlertSink::RedisAlertSink(RedisBus& redis, std::string stream)
    : redis_(redis)
    , stream_(std::move(stream))
{}

bool RedisAlertSink::publish(const AlertBatch& batch, TimePoint now) {
    if (batch.empty()) return true;
    return redis_.publish(stream_, batch_to_json(batch, now));
}
