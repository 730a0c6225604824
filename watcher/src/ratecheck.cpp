#include "config.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "provider_day.hpp"
#include "quota_tracker.hpp"
#include "rate_limit_client.hpp"
#include "token_manager.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

// Prints the provider's view of today's budget next to the local counter
int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        if (argc > 1) {
            config.config_file = argv[1];
        }
        setup_logging("ratecheck", config.log_level, "");

        config.load_file();
        if (config.client_id.empty() || config.client_secret.empty()) {
            throw std::runtime_error("API client id and secret are required");
        }

        curl_global_init(CURL_GLOBAL_DEFAULT);
        const TimePoint now = Clock::now();

        CurlHttpClient http(config.request_timeout_ms);

        OAuthSettings oauth;
        oauth.token_url = config.oauth_url;
        oauth.client_id = config.client_id;
        oauth.client_secret = config.client_secret;
        oauth.scope = config.oauth_scope;
        oauth.state_path = config.state_path(config.token_file);
        TokenManager tokens(http, oauth, util::real_sleeper());

        auto token = tokens.get_valid_token(now);
        if (!token.ok()) {
            spdlog::error("Could not obtain an access token: {}", token.error().message);
            curl_global_cleanup();
            return 1;
        }

        RateLimitClient client(http, config.api_base);
        auto provider = client.fetch(token.value());
        curl_global_cleanup();

        if (!provider.ok()) {
            spdlog::error("Rate limit query failed ({}): {}",
                          error_kind_name(provider.error().kind), provider.error().message);
            return 1;
        }

        const auto& q = provider.value();
        fmt::print("Provider daily budget\n");
        fmt::print("  Limit:     {}\n", q.limit);
        fmt::print("  Remaining: {}\n", q.remaining);
        fmt::print("  Used:      {}\n", q.count);
        fmt::print("  Reset at:  {}\n", q.reset ? util::to_iso8601(*q.reset) : "unknown");

        QuotaSettings settings;
        settings.daily_ceiling = config.daily_call_limit;
        settings.state_path = config.state_path(config.quota_file);
        QuotaTracker local(settings, now);
        const auto& saved = local.state();

        fmt::print("Local counter ({} Pacific)\n", provider_day::pacific_date(now));
        fmt::print("  Date:      {}\n", saved.date);
        fmt::print("  Used:      {}/{}\n", saved.calls_used, config.daily_call_limit);
        fmt::print("  Drift:     {}\n", q.count - saved.calls_used);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
