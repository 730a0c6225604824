#pragma once

#include "errors.hpp"
#include "http_client.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ProviderQuota {
    int limit = 0;
    int remaining = 0;
    int count = 0;
    std::optional<TimePoint> reset;
};

// Reads the provider's own view of the daily browse budget from the
// developer analytics endpoint. The query itself is not billed.
class RateLimitClient {
public:
    RateLimitClient(HttpClient& http, std::string api_base);

    Outcome<ProviderQuota> fetch(const std::string& token);

    static std::optional<ProviderQuota> parse(const nlohmann::json& body);

private:
    HttpClient& http_;
    std::string api_base_;
};
