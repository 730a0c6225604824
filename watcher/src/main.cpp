#include "config.hpp"
#include "health.hpp"
#include "heartbeat.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"
#include "quota_tracker.hpp"
#include "rate_limit_client.hpp"
#include "redis_bus.hpp"
#include "search_executor.hpp"
#include "seen_store.hpp"
#include "shutdown.hpp"
#include "token_manager.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <memory>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        if (argc > 1) {
            config.config_file = argv[1];
        }

        setup_logging("dealscout", config.log_level, config.log_file);

        spdlog::info("==============================================");
        spdlog::info("DealScout Watcher v{}", DEALSCOUT_VERSION);
        spdlog::info("==============================================");

        config.load_file();
        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        const TimePoint started = Clock::now();
        Sleeper sleeper = util::real_sleeper();

        // A sentinel left over from the previous run must not stop this one
        ShutdownSignal shutdown(config.state_path(config.shutdown_file), &shutdown_requested);
        shutdown.clear();

        CurlHttpClient http(config.request_timeout_ms);

        OAuthSettings oauth;
        oauth.token_url = config.oauth_url;
        oauth.client_id = config.client_id;
        oauth.client_secret = config.client_secret;
        oauth.scope = config.oauth_scope;
        oauth.state_path = config.state_path(config.token_file);
        oauth.retry_delay = std::chrono::milliseconds(config.token_retry_delay_ms);
        TokenManager tokens(http, oauth, sleeper);

        QuotaSettings quota_settings;
        quota_settings.daily_ceiling = config.daily_call_limit;
        quota_settings.anomaly_window = std::chrono::minutes(config.anomaly_window_minutes);
        quota_settings.sync_interval = std::chrono::minutes(config.quota_sync_minutes);
        quota_settings.drift_tolerance = config.drift_tolerance;
        quota_settings.state_path = config.state_path(config.quota_file);
        QuotaTracker quota(quota_settings, started);

        SeenStore seen(config.state_path(config.seen_file), static_cast<size_t>(config.max_seen_entries));
        seen.load();

        ExecutorSettings exec_settings;
        exec_settings.api_base = config.api_base;
        exec_settings.marketplace_id = config.marketplace_id;
        exec_settings.epn_campaign_id = config.epn_campaign_id;
        exec_settings.results_limit = config.results_limit;
        exec_settings.backoff_base = std::chrono::milliseconds(config.search_backoff_ms);
        SearchExecutor executor(http, tokens, quota, exec_settings, sleeper);

        RateLimitClient rate_limits(http, config.api_base);

        RedisBus redis(config.redis_url);
        RedisAlertSink alerts(redis, config.stream_alerts);

        Heartbeat heartbeat(config.state_path(config.heartbeat_file), config.service_name, DEALSCOUT_VERSION);

        OrchestratorSettings orch_settings;
        orch_settings.pacing.smart = config.smart_pacing;
        orch_settings.pacing.fixed_interval = std::chrono::seconds(config.cycle_interval_seconds);
        orch_settings.pacing.anomaly_retry = std::chrono::seconds(config.anomaly_retry_seconds);
        orch_settings.sleep_tick = std::chrono::seconds(config.sleep_tick_seconds);
        orch_settings.seen_retention_days = config.seen_retention_days;
        orch_settings.alert_after_failures = config.alert_after_failures;

        CycleOrchestrator orchestrator(config.searches, executor, tokens, quota, rate_limits,
                                       seen, alerts, heartbeat, shutdown, orch_settings,
                                       []() { return Clock::now(); }, sleeper);

        // A cycle can legitimately sleep up to an hour when the budget is spent
        HealthCheck health(&redis, config.service_name,
                           orch_settings.pacing.max_wait + std::chrono::minutes(15));
        orchestrator.set_health(&health);

        std::unique_ptr<HealthServer> health_server;
        if (config.listen_port > 0) {
            health_server = std::make_unique<HealthServer>(health, config.listen_addr, config.listen_port);
            if (!health_server->start()) {
                health_server.reset();
            }
        }

        orchestrator.run();

        if (health_server) {
            health_server->stop();
        }
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
