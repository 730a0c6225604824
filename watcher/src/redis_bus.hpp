#pragma once

#include "alert_sink.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    // Appends {"data": <json>} to the stream; false on failure
    bool publish(const std::string& stream, const nlohmann::json& data);

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Hands alert batches to the notifier over a Redis stream
class RedisAlertSink : public AlertSink {
public:
    RedisAlertSink(RedisBus& redis, std::string stream);

    bool publish(const AlertBatch& batch, TimePoint now) override;

private:
    RedisBus& redis_;
    std::string stream_;
};
