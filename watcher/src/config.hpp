#pragma once

#include "search_spec.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct Config {
    // Provider
    std::string api_base;
    std::string oauth_url;
    std::string oauth_scope;
    std::string marketplace_id;
    std::string client_id;
    std::string client_secret;
    std::string epn_campaign_id;

    // Searches, from the JSON config file
    std::string config_file;
    std::vector<SearchSpec> searches;

    // State files
    std::string state_dir;
    std::string quota_file;
    std::string token_file;
    std::string seen_file;
    std::string heartbeat_file;
    std::string shutdown_file;

    // Budget
    int daily_call_limit;
    int quota_sync_minutes;
    int anomaly_window_minutes;
    int anomaly_retry_seconds;
    int drift_tolerance;

    // Cycle
    int cycle_interval_seconds;
    bool smart_pacing;
    int sleep_tick_seconds;
    int seen_retention_days;
    int alert_after_failures;
    int max_seen_entries;
    int results_limit;
    int request_timeout_ms;
    int token_retry_delay_ms;
    int search_backoff_ms;

    // Redis
    std::string redis_url;
    std::string stream_alerts;

    // HTTP server
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    std::string log_file;

    static Config from_env();

    // Reads credentials and searches from config_file; environment
    // credentials win over the file
    void load_file();
    void apply_document(const nlohmann::json& doc);

    void validate() const;

    std::string state_path(const std::string& file) const;
    int enabled_search_count() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
