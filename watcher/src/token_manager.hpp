#pragma once

#include "errors.hpp"
#include "http_client.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

struct TokenState {
    std::string access_token;
    TimePoint expires_at{};

    bool empty() const { return access_token.empty(); }
};

void to_json(nlohmann::json& j, const TokenState& t);
void from_json(const nlohmann::json& j, TokenState& t);

struct OAuthSettings {
    std::string token_url;
    std::string client_id;
    std::string client_secret;
    std::string scope;
    std::string state_path;
    std::chrono::seconds safety_margin{60};
    std::chrono::seconds default_lifetime{7200};
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{5000};
};

// Client-credentials OAuth token cache. A token is handed out only while it
// is still valid for at least the safety margin; otherwise a fresh one is
// requested. The cached token survives restarts via the token state file.
class TokenManager {
public:
    TokenManager(HttpClient& http, OAuthSettings settings, Sleeper sleeper);

    Outcome<std::string> get_valid_token(TimePoint now);

    // Forget the cached token; the next get_valid_token() refreshes
    void invalidate();

    bool has_usable_token(TimePoint now) const;
    const TokenState& state() const { return state_; }
    int refresh_count() const { return refresh_count_; }

private:
    HttpClient& http_;
    OAuthSettings settings_;
    Sleeper sleeper_;
    TokenState state_;
    int refresh_count_ = 0;

    Outcome<TokenState> request_token(TimePoint now);
    HttpHeaders auth_headers() const;
};
