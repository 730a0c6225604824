#include "rate_limit_client.hpp"
#include <spdlog/spdlog.h>

namespace {

constexpr int kDailyWindow = 86400;

const nlohmann::json* find_daily_rate(const nlohmann::json& resource) {
    if (!resource.contains("rates") || !resource.at("rates").is_array()) return nullptr;
    for (const auto& rate : resource.at("rates")) {
        if (rate.value("timeWindow", 0) == kDailyWindow) {
            return &rate;
        }
    }
    return nullptr;
}

} // namespace

RateLimitClient::RateLimitClient(HttpClient& http, std::string api_base)
    : http_(http)
    , api_base_(std::move(api_base))
{}

std::optional<ProviderQuota> RateLimitClient::parse(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("rateLimits") || !body.at("rateLimits").is_array()) {
        return std::nullopt;
    }

    const nlohmann::json* browse = nullptr;
    const nlohmann::json* fallback = nullptr;

    for (const auto& api : body.at("rateLimits")) {
        if (!api.contains("resources") || !api.at("resources").is_array()) continue;
        for (const auto& resource : api.at("resources")) {
            const nlohmann::json* daily = find_daily_rate(resource);
            if (!daily) continue;
            if (!fallback) fallback = daily;
            if (resource.value("name", "") == "buy.browse") {
                browse = daily;
                break;
            }
        }
        if (browse) break;
    }

    const nlohmann::json* rate = browse ? browse : fallback;
    if (!rate) {
        return std::nullopt;
    }

    ProviderQuota quota;
    quota.limit = rate->value("limit", 5000);
    quota.remaining = rate->value("remaining", quota.limit);
    quota.count = rate->value("count", quota.limit - quota.remaining);
    if (rate->contains("reset") && rate->at("reset").is_string()) {
        quota.reset = util::parse_iso8601(rate->at("reset").get<std::string>());
    }
    return quota;
}

Outcome<ProviderQuota> RateLimitClient::fetch(const std::string& token) {
    const std::string url = api_base_ + "/developer/analytics/v1_beta/rate_limit/?api_name=browse";
    auto response = http_.get(url, {
        "Authorization: Bearer " + token,
        "Accept: application/json"
    });

    if (!response.reached_server()) {
        return Outcome<ProviderQuota>::failure(ErrorKind::TransientHttp,
                                               "rate limit query failed: " + response.error);
    }
    if (response.status == 401) {
        return Outcome<ProviderQuota>::failure(ErrorKind::Auth, "rate limit query unauthorized", 401);
    }
    if (!response.is_success()) {
        ErrorKind kind = response.status >= 500 || response.status == 429
            ? ErrorKind::TransientHttp
            : ErrorKind::PermanentHttp;
        return Outcome<ProviderQuota>::failure(kind, "rate limit query failed", response.status);
    }

    try {
        auto quota = parse(nlohmann::json::parse(response.body));
        if (!quota) {
            return Outcome<ProviderQuota>::failure(ErrorKind::PermanentHttp,
                                                   "browse limits not found in response",
                                                   response.status);
        }
        spdlog::debug("Provider quota: {}/{} remaining", quota->remaining, quota->limit);
        return Outcome<ProviderQuota>::success(*quota);
    } catch (const nlohmann::json::exception& e) {
        return Outcome<ProviderQuota>::failure(ErrorKind::PermanentHttp,
                                               std::string("malformed rate limit response: ") + e.what(),
                                               response.status);
    }
}
