#include "token_manager.hpp"
#include "state_store.hpp"
#include <spdlog/spdlog.h>

void to_json(nlohmann::json& j, const TokenState& t) {
    j = nlohmann::json{
        {"access_token", t.access_token},
        {"expires_at", util::to_iso8601(t.expires_at)}
    };
}

void from_json(const nlohmann::json& j, TokenState& t) {
    t.access_token = j.at("access_token").get<std::string>();
    // An unparseable expiry reads as already expired
    auto expires = util::parse_iso8601(j.at("expires_at").get<std::string>());
    t.expires_at = expires.value_or(TimePoint{});
}

TokenManager::TokenManager(HttpClient& http, OAuthSettings settings, Sleeper sleeper)
    : http_(http)
    , settings_(std::move(settings))
    , sleeper_(std::move(sleeper))
{
    if (!settings_.state_path.empty()) {
        state_ = StateStore::load(settings_.state_path, TokenState{});
        if (!state_.empty()) {
            spdlog::info("Loaded cached token (expires {})", util::to_iso8601(state_.expires_at));
        }
    }
}

bool TokenManager::has_usable_token(TimePoint now) const {
    return !state_.empty() && now + settings_.safety_margin < state_.expires_at;
}

Outcome<std::string> TokenManager::get_valid_token(TimePoint now) {
    if (has_usable_token(now)) {
        return Outcome<std::string>::success(state_.access_token);
    }

    auto fresh = request_token(now);
    if (!fresh.ok()) {
        return Outcome<std::string>::failure(fresh.error());
    }

    state_ = fresh.value();
    ++refresh_count_;

    if (!settings_.state_path.empty() && !StateStore::save(settings_.state_path, state_)) {
        spdlog::warn("Token refreshed but could not be persisted");
    }

    return Outcome<std::string>::success(state_.access_token);
}

void TokenManager::invalidate() {
    if (!state_.empty()) {
        spdlog::info("Invalidating cached access token");
    }
    state_ = TokenState{};
}

HttpHeaders TokenManager::auth_headers() const {
    std::string credentials = settings_.client_id + ":" + settings_.client_secret;
    return {
        "Content-Type: application/x-www-form-urlencoded",
        "Authorization: Basic " + util::base64_encode(credentials)
    };
}

Outcome<TokenState> TokenManager::request_token(TimePoint now) {
    const std::string body = "grant_type=client_credentials&scope=" + url_escape(settings_.scope);
    const int attempts = settings_.max_retries + 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        spdlog::debug("Requesting access token (attempt {}/{})", attempt, attempts);
        auto response = http_.post_form(settings_.token_url, body, auth_headers());

        bool transient = !response.reached_server() ||
                         response.status == 429 ||
                         response.status >= 500;

        if (response.is_success()) {
            try {
                auto json = nlohmann::json::parse(response.body);
                TokenState token;
                token.access_token = json.at("access_token").get<std::string>();
                auto lifetime = std::chrono::seconds(
                    json.value("expires_in", static_cast<int64_t>(settings_.default_lifetime.count())));
                token.expires_at = now + lifetime;

                spdlog::info("Access token refreshed ({} chars, valid {}s)",
                             token.access_token.size(), lifetime.count());
                return Outcome<TokenState>::success(std::move(token));
            } catch (const nlohmann::json::exception& e) {
                return Outcome<TokenState>::failure(
                    ErrorKind::Auth, std::string("malformed token response: ") + e.what(),
                    response.status);
            }
        }

        if (!transient) {
            spdlog::error("Token request rejected with HTTP {}", response.status);
            return Outcome<TokenState>::failure(
                ErrorKind::Auth, "token request rejected", response.status);
        }

        if (response.reached_server()) {
            spdlog::warn("Token request failed with HTTP {} (attempt {}/{})",
                         response.status, attempt, attempts);
        } else {
            spdlog::warn("Token request failed: {} (attempt {}/{})",
                         response.error, attempt, attempts);
        }

        if (attempt < attempts) {
            sleeper_(settings_.retry_delay * attempt);
        }
    }

    return Outcome<TokenState>::failure(
        ErrorKind::Auth, "token endpoint unavailable after retries");
}
