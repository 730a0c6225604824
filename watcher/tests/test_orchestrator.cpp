#include <catch2/catch_test_macros.hpp>
#include "../src/orchestrator.hpp"
#include "fakes.hpp"
#include <filesystem>

namespace {

SearchSpec make_search(const std::string& name, const std::string& query, double max_price) {
    SearchSpec spec;
    spec.name = name;
    spec.query = query;
    spec.max_price = max_price;
    return spec;
}

struct Harness {
    TempDir dir;
    ScriptedHttpClient http;
    RecordingSleeper sleeper;
    RecordingAlertSink alerts;
    TimePoint now = at("2026-07-15T18:00:00Z");

    TokenManager tokens;
    QuotaTracker quota;
    SeenStore seen;
    SearchExecutor executor;
    RateLimitClient rate_limits;
    Heartbeat heartbeat;
    ShutdownSignal shutdown;
    CycleOrchestrator orchestrator;

    explicit Harness(std::vector<SearchSpec> specs, bool presync = true)
        : tokens(http, oauth(), sleeper.fn())
        , quota(quota_settings(), now)
        , seen(dir.file("seen.json"))
        , executor(http, tokens, quota, exec_settings(), sleeper.fn())
        , rate_limits(http, "https://api.test")
        , heartbeat(dir.file("heartbeat.json"), "watcher", "test")
        , shutdown(dir.file(".shutdown_requested"))
        , orchestrator(std::move(specs), executor, tokens, quota, rate_limits, seen, alerts,
                       heartbeat, shutdown, OrchestratorSettings{},
                       [this] { return now; }, sleeper.fn())
    {
        if (presync) {
            quota.sync_with_provider(5000, 5000, at("2026-07-16T07:00:00Z"), now);
        }
    }

    OAuthSettings oauth() const {
        OAuthSettings s;
        s.token_url = "https://auth.test/identity/v1/oauth2/token";
        s.client_id = "id";
        s.client_secret = "secret";
        s.state_path = dir.file("token.json");
        s.retry_delay = std::chrono::milliseconds(1);
        return s;
    }

    QuotaSettings quota_settings() const {
        QuotaSettings s;
        s.daily_ceiling = 4500;
        s.state_path = dir.file("quota.json");
        return s;
    }

    static ExecutorSettings exec_settings() {
        ExecutorSettings s;
        s.api_base = "https://api.test";
        s.backoff_base = std::chrono::milliseconds(1);
        return s;
    }
};

} // namespace

TEST_CASE("Searches are isolated from each other", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0),
               make_search("Gadget", "gadget pro", 250.0)});

    for (int i = 0; i < 3; ++i) {
        h.http.enqueue("oauth2/token", status_response(503));
    }
    h.http.always("oauth2/token", token_response("tok-1"));
    h.http.always("q=gadget", search_response({item_summary("G1", 199.0, "Gadget Pro boxed")}));

    auto report = h.orchestrator.run_cycle();

    REQUIRE(report.specs.size() == 2);
    REQUIRE(report.specs[0].error == ErrorKind::Auth);
    REQUIRE_FALSE(report.specs[1].error);
    REQUIRE(report.new_listings == 1);
    REQUIRE_FALSE(report.all_failed);
    REQUIRE(h.http.count("q=acme") == 0);

    REQUIRE(h.alerts.batches.size() == 1);
    REQUIRE(h.alerts.batches[0].search_name == "Gadget");
    REQUIRE(h.alerts.batches[0].items[0].listing.item_id == "G1");
}

TEST_CASE("Price changes across cycles", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0)});
    h.http.always("oauth2/token", token_response("tok-1"));

    SECTION("Drop into the band is alerted once") {
        h.http.enqueue("item_summary/search", search_response({item_summary("X123", 50.0, "Acme Widget X")}));
        h.http.always("item_summary/search", search_response({item_summary("X123", 40.0, "Acme Widget X")}));

        auto first = h.orchestrator.run_cycle();
        REQUIRE(first.new_listings == 0);
        REQUIRE(first.price_drops == 0);
        REQUIRE(h.alerts.batches.empty());
        REQUIRE(h.seen.lookup("X123")->last_price == 50.0);

        h.now += std::chrono::minutes(5);
        auto second = h.orchestrator.run_cycle();
        REQUIRE(second.price_drops == 1);
        REQUIRE(h.alerts.batches.size() == 1);
        REQUIRE(h.alerts.batches[0].kind == AlertKind::PriceDrops);
        REQUIRE(h.alerts.batches[0].items[0].old_price == 50.0);

        h.now += std::chrono::minutes(5);
        auto third = h.orchestrator.run_cycle();
        REQUIRE(third.price_drops == 0);
        REQUIRE(h.alerts.batches.size() == 1);
    }

    SECTION("Repeat sightings are not alerted") {
        h.http.always("item_summary/search", search_response({item_summary("X9", 40.0, "Acme Widget X")}));

        REQUIRE(h.orchestrator.run_cycle().new_listings == 1);
        h.now += std::chrono::minutes(5);
        REQUIRE(h.orchestrator.run_cycle().new_listings == 0);
        REQUIRE(h.alerts.batches.size() == 1);
        REQUIRE(h.alerts.batches[0].kind == AlertKind::NewListings);
    }

    SECTION("Failed hand-off does not stop the cycle") {
        h.alerts.fail = true;
        h.http.always("item_summary/search", search_response({item_summary("X9", 40.0, "Acme Widget X")}));

        auto report = h.orchestrator.run_cycle();
        REQUIRE(report.new_listings == 1);
        REQUIRE(h.seen.lookup("X9"));
        REQUIRE(std::filesystem::exists(h.dir.file("seen.json")));
    }
}

TEST_CASE("Failure backoff and budget", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0),
               make_search("Gadget", "gadget pro", 250.0)});
    h.http.always("oauth2/token", token_response("tok-1"));

    SECTION("Every search failing backs off exponentially") {
        h.http.always("item_summary/search", status_response(400));

        auto first = h.orchestrator.run_cycle();
        REQUIRE(first.all_failed);
        REQUIRE(first.next_interval == std::chrono::seconds(60));

        auto second = h.orchestrator.run_cycle();
        REQUIRE(second.next_interval == std::chrono::seconds(120));
        REQUIRE(h.orchestrator.consecutive_failures() == 2);
    }

    SECTION("Exhausted budget skips every search") {
        h.quota.record_spend(4500, h.now);

        auto report = h.orchestrator.run_cycle();
        REQUIRE(h.http.count("item_summary/search") == 0);
        REQUIRE(report.specs.size() == 2);
        REQUIRE(report.specs[0].error == ErrorKind::RateLimit);
        REQUIRE_FALSE(report.all_failed);
        REQUIRE_FALSE(report.quota_anomaly);
        // 11:00 Pacific: wait out the day, bounded by the maximum wait
        REQUIRE(report.next_interval == std::chrono::seconds(3600));
    }

    SECTION("Operator hears about the exhausted budget once per day") {
        h.quota.record_spend(4500, h.now);

        h.orchestrator.run_cycle();
        REQUIRE(h.alerts.batches.size() == 1);
        REQUIRE(h.alerts.batches[0].kind == AlertKind::Operator);
        REQUIRE(h.alerts.batches[0].message.find("Rate limit reached") != std::string::npos);
        REQUIRE(h.quota.limit_alert_sent());

        h.now += std::chrono::minutes(30);
        h.orchestrator.run_cycle();
        REQUIRE(h.alerts.batches.size() == 1);

        // Past the provider reset the flag is cleared with the counter
        h.now = at("2026-07-16T07:05:00Z");
        h.http.always("item_summary/search", search_response({}));
        h.orchestrator.run_cycle();
        REQUIRE_FALSE(h.quota.limit_alert_sent());
        REQUIRE(h.alerts.batches.size() == 1);
    }

    SECTION("Undelivered budget alert is retried") {
        h.quota.record_spend(4500, h.now);
        h.alerts.fail = true;

        h.orchestrator.run_cycle();
        REQUIRE_FALSE(h.quota.limit_alert_sent());

        h.alerts.fail = false;
        h.now += std::chrono::minutes(30);
        h.orchestrator.run_cycle();
        REQUIRE(h.alerts.batches.size() == 1);
        REQUIRE(h.quota.limit_alert_sent());
    }

    SECTION("Operator hears about repeated failed cycles") {
        h.http.always("item_summary/search", status_response(400));

        h.orchestrator.run_cycle();
        h.orchestrator.run_cycle();
        REQUIRE(h.alerts.batches.empty());

        h.orchestrator.run_cycle();
        REQUIRE(h.orchestrator.consecutive_failures() == 3);
        REQUIRE(h.alerts.batches.size() == 1);
        REQUIRE(h.alerts.batches[0].kind == AlertKind::Operator);
        REQUIRE(h.alerts.batches[0].message == "Every search has failed for 3 cycles in a row");

        h.orchestrator.run_cycle();
        REQUIRE(h.alerts.batches.size() == 1);
    }
}

TEST_CASE("Stale provider data right after a reset", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0)}, false);
    h.http.always("oauth2/token", token_response("tok-1"));
    h.http.always("rate_limit", json_response(200, {
        {"rateLimits", nlohmann::json::array({
            {{"resources", nlohmann::json::array({
                {{"name", "buy.browse"},
                 {"rates", nlohmann::json::array({
                     {{"limit", 5000}, {"remaining", 0}, {"count", 5000},
                      {"reset", "2026-07-16T07:00:00Z"}, {"timeWindow", 86400}}
                 })}}
            })}}
        })}
    }));

    // Three minutes into the next provider day
    h.now = at("2026-07-16T07:03:00Z");
    auto report = h.orchestrator.run_cycle();

    REQUIRE(h.http.count("rate_limit") == 1);
    REQUIRE(h.http.count("item_summary/search") == 0);
    REQUIRE(report.quota_anomaly);
    REQUIRE(report.next_interval == std::chrono::seconds(120));
    REQUIRE(h.alerts.batches.empty());
}

TEST_CASE("Quota sync with the provider", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0)}, false);
    h.http.always("oauth2/token", token_response("tok-1"));
    h.http.always("item_summary/search", search_response({}));
    h.http.always("rate_limit", json_response(200, {
        {"rateLimits", nlohmann::json::array({
            {{"resources", nlohmann::json::array({
                {{"name", "buy.browse"},
                 {"rates", nlohmann::json::array({
                     {{"limit", 5000}, {"remaining", 4000}, {"count", 1000},
                      {"reset", "2026-07-16T07:00:00Z"}, {"timeWindow", 86400}}
                 })}}
            })}}
        })}
    }));

    h.orchestrator.run_cycle();
    REQUIRE(h.http.count("rate_limit") == 1);
    REQUIRE(h.quota.state().calls_used == 1001);
    REQUIRE(h.quota.state().reset_time_utc == at("2026-07-16T07:00:00Z"));

    // Not due again within the sync interval
    h.now += std::chrono::minutes(5);
    h.orchestrator.run_cycle();
    REQUIRE(h.http.count("rate_limit") == 1);
}

TEST_CASE("Sleeping and shutdown", "[orchestrator]") {
    Harness h({make_search("Widget", "acme widget", 45.0)});
    h.http.always("oauth2/token", token_response("tok-1"));
    h.http.always("item_summary/search", search_response({}));

    SECTION("Sleep is split into ticks") {
        REQUIRE_FALSE(h.orchestrator.sleep_between_cycles(std::chrono::seconds(5)));
        REQUIRE(h.sleeper.delays.size() == 5);
        REQUIRE(h.orchestrator.state() == CycleState::Sleeping);
    }

    SECTION("A pending request cuts the sleep short") {
        h.shutdown.request();
        REQUIRE(h.orchestrator.sleep_between_cycles(std::chrono::seconds(5)));
        REQUIRE(h.sleeper.delays.empty());
    }

    SECTION("Sentinel file stops the loop after the current cycle") {
        h.dir.write(".shutdown_requested", "");

        h.orchestrator.run();

        REQUIRE(h.orchestrator.cycles_completed() == 1);
        REQUIRE(h.orchestrator.state() == CycleState::ShuttingDown);
        REQUIRE_FALSE(std::filesystem::exists(h.dir.file(".shutdown_requested")));
        REQUIRE(std::filesystem::exists(h.dir.file("seen.json")));
        REQUIRE(std::filesystem::exists(h.dir.file("quota.json")));
        REQUIRE(Heartbeat::last_beat(h.dir.file("heartbeat.json")) == h.now);
    }
}
