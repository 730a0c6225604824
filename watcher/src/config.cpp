#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_lower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.api_base = get_env("API_BASE", "https://api.ebay.com");
    cfg.oauth_url = get_env("OAUTH_URL", cfg.api_base + "/identity/v1/oauth2/token");
    cfg.oauth_scope = get_env("OAUTH_SCOPE", "https://api.ebay.com/oauth/api_scope");
    cfg.marketplace_id = get_env("MARKETPLACE_ID", "EBAY_US");
    cfg.client_id = get_env("API_CLIENT_ID");
    cfg.client_secret = get_env("API_CLIENT_SECRET");
    cfg.epn_campaign_id = get_env("EPN_CAMPAIGN_ID");

    cfg.config_file = get_env("CONFIG_FILE", "dealscout_config.json");

    cfg.state_dir = get_env("STATE_DIR", ".");
    cfg.quota_file = get_env("QUOTA_FILE", "dealscout_quota.json");
    cfg.token_file = get_env("TOKEN_FILE", "dealscout_token.json");
    cfg.seen_file = get_env("SEEN_FILE", "dealscout_seen.json");
    cfg.heartbeat_file = get_env("HEARTBEAT_FILE", "dealscout_heartbeat.json");
    cfg.shutdown_file = get_env("SHUTDOWN_FILE", ".shutdown_requested");

    cfg.daily_call_limit = get_env_int("DAILY_CALL_LIMIT", 4500);
    cfg.quota_sync_minutes = get_env_int("QUOTA_SYNC_MINUTES", 30);
    cfg.anomaly_window_minutes = get_env_int("ANOMALY_WINDOW_MINUTES", 10);
    cfg.anomaly_retry_seconds = get_env_int("ANOMALY_RETRY_SECONDS", 120);
    cfg.drift_tolerance = get_env_int("QUOTA_DRIFT_TOLERANCE", 10);

    cfg.cycle_interval_seconds = get_env_int("CYCLE_INTERVAL_SECONDS", 300);
    cfg.smart_pacing = get_env_bool("SMART_PACING", true);
    cfg.sleep_tick_seconds = get_env_int("SLEEP_TICK_SECONDS", 1);
    cfg.seen_retention_days = get_env_int("SEEN_RETENTION_DAYS", 14);
    cfg.alert_after_failures = get_env_int("ALERT_AFTER_FAILURES", 3);
    cfg.max_seen_entries = get_env_int("MAX_SEEN_ENTRIES", 50000);
    cfg.results_limit = get_env_int("RESULTS_LIMIT", 150);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 15000);
    cfg.token_retry_delay_ms = get_env_int("TOKEN_RETRY_DELAY_MS", 5000);
    cfg.search_backoff_ms = get_env_int("SEARCH_BACKOFF_MS", 1000);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_alerts = get_env("STREAM_ALERTS", "dealscout.alerts");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "watcher");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.log_file = get_env("LOG_FILE");

    return cfg;
}

void Config::load_file() {
    if (!std::filesystem::exists(config_file)) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    std::ifstream in(config_file);
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Config file " + config_file + " is not valid JSON: " + e.what());
    }
    apply_document(doc);
}

void Config::apply_document(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config document must be a JSON object");
    }

    if (doc.contains("api_credentials")) {
        const auto& creds = doc.at("api_credentials");
        if (client_id.empty()) client_id = creds.value("client_id", "");
        if (client_secret.empty()) client_secret = creds.value("client_secret", "");
        if (epn_campaign_id.empty()) epn_campaign_id = creds.value("epn_campaign_id", "");
    }

    searches.clear();
    if (doc.contains("searches")) {
        for (const auto& entry : doc.at("searches")) {
            try {
                searches.push_back(entry.get<SearchSpec>());
            } catch (const nlohmann::json::exception& e) {
                throw std::runtime_error(std::string("Invalid search entry: ") + e.what());
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(std::string("Invalid search entry: ") + e.what());
            }
        }
    }
}

void Config::validate() const {
    if (client_id.empty() || client_secret.empty()) {
        throw std::runtime_error("API client id and secret are required");
    }
    if (searches.empty()) {
        throw std::runtime_error("At least one search must be configured");
    }
    for (const auto& spec : searches) {
        auto errors = spec.validation_errors();
        if (!errors.empty()) {
            throw std::runtime_error("Search '" + spec.name + "': " + errors.front());
        }
    }
    if (enabled_search_count() == 0) {
        throw std::runtime_error("All searches are disabled");
    }
    if (daily_call_limit <= 0) {
        throw std::runtime_error("DAILY_CALL_LIMIT must be positive");
    }
    if (sleep_tick_seconds <= 0) {
        throw std::runtime_error("SLEEP_TICK_SECONDS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Searches: {} ({} enabled)", searches.size(), enabled_search_count());
    spdlog::info("  Daily call ceiling: {}", daily_call_limit);
    spdlog::info("  Pacing: {}", smart_pacing ? "smart" : std::to_string(cycle_interval_seconds) + "s fixed");
}

std::string Config::state_path(const std::string& file) const {
    if (file.empty()) return file;
    std::filesystem::path p(file);
    if (p.is_absolute() || state_dir.empty()) return file;
    return (std::filesystem::path(state_dir) / p).string();
}

int Config::enabled_search_count() const {
    int count = 0;
    for (const auto& spec : searches) {
        if (spec.enabled) ++count;
    }
    return count;
}
