#include "orchestrator.hpp"
#include "classifier.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

void log_spec_failure(const SearchSpec& spec, const FetchError& error) {
    switch (error.kind) {
        case ErrorKind::Auth:
            spdlog::error("[{}] Authentication failed: {}", spec.name, error.message);
            break;
        case ErrorKind::RateLimit:
            spdlog::warn("[{}] Rate limited: {}", spec.name, error.message);
            break;
        case ErrorKind::TransientHttp:
            spdlog::warn("[{}] Provider unavailable (HTTP {}): {}",
                         spec.name, error.http_status, error.message);
            break;
        case ErrorKind::PermanentHttp:
            spdlog::error("[{}] Search rejected (HTTP {}): {}",
                          spec.name, error.http_status, error.message);
            break;
        case ErrorKind::StorageCorruption:
            spdlog::error("[{}] Storage problem: {}", spec.name, error.message);
            break;
    }
}

} // namespace

const char* cycle_state_name(CycleState state) {
    switch (state) {
        case CycleState::Idle: return "idle";
        case CycleState::Running: return "running";
        case CycleState::Sleeping: return "sleeping";
        case CycleState::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

CycleOrchestrator::CycleOrchestrator(std::vector<SearchSpec> specs,
                                     SearchExecutor& executor,
                                     TokenManager& tokens,
                                     QuotaTracker& quota,
                                     RateLimitClient& rate_limits,
                                     SeenStore& seen,
                                     AlertSink& alerts,
                                     Heartbeat& heartbeat,
                                     ShutdownSignal& shutdown,
                                     OrchestratorSettings settings,
                                     ClockFn clock,
                                     Sleeper sleeper)
    : specs_(std::move(specs))
    , executor_(executor)
    , tokens_(tokens)
    , quota_(quota)
    , rate_limits_(rate_limits)
    , seen_(seen)
    , alerts_(alerts)
    , heartbeat_(heartbeat)
    , shutdown_(shutdown)
    , settings_(std::move(settings))
    , clock_(std::move(clock))
    , sleeper_(std::move(sleeper))
{}

int CycleOrchestrator::enabled_specs() const {
    return static_cast<int>(std::count_if(specs_.begin(), specs_.end(),
                                          [](const SearchSpec& s) { return s.enabled; }));
}

nlohmann::json CycleOrchestrator::heartbeat_details() const {
    return {
        {"cycle", cycles_},
        {"state", cycle_state_name(state_)},
        {"calls_used", quota_.state().calls_used}
    };
}

void CycleOrchestrator::run() {
    spdlog::info("Watching {} enabled searches", enabled_specs());
    for (const auto& spec : specs_) {
        if (!spec.enabled) continue;
        spdlog::debug("  {}: \"{}\" {:.2f}-{:.2f}, condition {}", spec.name, spec.query,
                      spec.min_price, spec.max_price, condition_name(spec.condition));
    }

    while (true) {
        CycleReport report = run_cycle();
        if (sleep_between_cycles(report.next_interval)) {
            break;
        }
    }

    shutdown_sequence();
}

CycleReport CycleOrchestrator::run_cycle() {
    state_ = CycleState::Running;
    CycleReport report;
    report.cycle = ++cycles_;

    TimePoint now = clock_();
    spdlog::info("Cycle {} started ({}/{} calls used today)", report.cycle,
                 quota_.state().calls_used, quota_.settings().daily_ceiling);
    heartbeat_.beat(now, heartbeat_details());

    quota_.rollover_if_needed(now);
    sync_quota(now);

    int attempted = 0;
    int failed = 0;
    for (const auto& spec : specs_) {
        if (!spec.enabled) continue;

        SpecReport spec_report = process_spec(spec, clock_());
        if (!spec_report.error || *spec_report.error != ErrorKind::RateLimit) {
            ++attempted;
            if (spec_report.error) ++failed;
        }
        report.new_listings += spec_report.new_listings;
        report.price_drops += spec_report.price_drops;
        report.specs.push_back(std::move(spec_report));
    }

    now = clock_();
    seen_.evict_expired(now, settings_.seen_retention_days);
    seen_.enforce_cap();
    persist_state();

    report.all_failed = attempted > 0 && failed == attempted;
    consecutive_failures_ = report.all_failed ? consecutive_failures_ + 1 : 0;
    report.quota_anomaly = quota_.detect_sync_anomaly(now);

    if (report.all_failed) {
        report.next_interval = failure_backoff(consecutive_failures_, settings_.pacing);
        spdlog::warn("Every search failed ({} cycles in a row), backing off {}s",
                     consecutive_failures_, report.next_interval.count());
        if (consecutive_failures_ == settings_.alert_after_failures) {
            notify_operator(fmt::format("Every search has failed for {} cycles in a row",
                                        consecutive_failures_), now);
        }
    } else {
        report.next_interval = next_cycle_interval(quota_, enabled_specs(), now, settings_.pacing);
    }
    if (report.quota_anomaly) {
        report.next_interval = std::min(report.next_interval, settings_.pacing.anomaly_retry);
    }

    spdlog::info("Cycle {} done: {} new, {} price drops, {}/{} calls used, next in {}s",
                 report.cycle, report.new_listings, report.price_drops,
                 quota_.state().calls_used, quota_.settings().daily_ceiling,
                 report.next_interval.count());

    last_report_ = report;
    last_cycle_at_ = now;
    state_ = CycleState::Sleeping;
    heartbeat_.beat(now, heartbeat_details());
    publish_health();
    return report;
}

SpecReport CycleOrchestrator::process_spec(const SearchSpec& spec, TimePoint now) {
    SpecReport report;
    report.name = spec.name;

    try {
        quota_.rollover_if_needed(now);
        if (!quota_.can_spend(1)) {
            spdlog::warn("[{}] Skipped, daily call budget exhausted", spec.name);
            notify_limit_reached(now);
            report.error = ErrorKind::RateLimit;
            return report;
        }

        auto outcome = executor_.execute(spec, now);
        report.attempts = executor_.last_attempts();
        if (!outcome.ok()) {
            log_spec_failure(spec, outcome.error());
            report.error = outcome.error().kind;
            return report;
        }

        AlertBatch fresh;
        fresh.kind = AlertKind::NewListings;
        fresh.search_name = spec.name;

        AlertBatch drops;
        drops.kind = AlertKind::PriceDrops;
        drops.search_name = spec.name;

        for (const auto& listing : outcome.value()) {
            auto previous = seen_.record_seen(listing.item_id, listing.price, now, listing.title);
            switch (classify_sighting(previous, listing, spec)) {
                case SightingKind::NewListing:
                    fresh.items.push_back({listing, std::nullopt});
                    break;
                case SightingKind::PriceDrop:
                    spdlog::info("[{}] Price drop {}: {:.2f} -> {:.2f}",
                                 spec.name, listing.item_id, *previous, listing.price);
                    drops.items.push_back({listing, previous});
                    break;
                case SightingKind::Repeat:
                case SightingKind::OutOfBand:
                case SightingKind::Rejected:
                    break;
            }
        }

        report.listings = outcome.value().size();
        report.new_listings = fresh.items.size();
        report.price_drops = drops.items.size();

        dispatch(fresh, now);
        dispatch(drops, now);

        spdlog::info("[{}] {} listings, {} new, {} price drops",
                     spec.name, report.listings, report.new_listings, report.price_drops);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Search processing failed: {}", spec.name, e.what());
        report.error = ErrorKind::PermanentHttp;
    }

    return report;
}

void CycleOrchestrator::sync_quota(TimePoint now) {
    if (!quota_.needs_resync(now)) {
        return;
    }
    if (quota_.detect_sync_anomaly(now)) {
        spdlog::warn("Quota looks exhausted right after a reset, checking with the provider");
    }

    auto token = tokens_.get_valid_token(now);
    if (!token.ok()) {
        spdlog::warn("Skipping quota sync, no token: {}", token.error().message);
        return;
    }

    auto provider = rate_limits_.fetch(token.value());
    if (!provider.ok()) {
        if (provider.error().kind == ErrorKind::Auth) {
            tokens_.invalidate();
        }
        spdlog::warn("Quota sync failed: {}", provider.error().message);
        return;
    }

    const auto& q = provider.value();
    quota_.sync_with_provider(q.limit, q.remaining, q.reset, now);
}

void CycleOrchestrator::dispatch(const AlertBatch& batch, TimePoint now) {
    if (batch.empty()) return;

    const char* what = batch.kind == AlertKind::PriceDrops ? "price drops" : "new listings";
    if (alerts_.publish(batch, now)) {
        spdlog::info("[{}] Handed off {} {}", batch.search_name, batch.items.size(), what);
    } else {
        spdlog::error("[{}] Could not hand off {} {}", batch.search_name, batch.items.size(), what);
    }
}

bool CycleOrchestrator::notify_operator(const std::string& message, TimePoint now) {
    if (alerts_.publish(operator_alert(message), now)) {
        spdlog::info("Operator alert sent: {}", message);
        return true;
    }
    spdlog::error("Could not send operator alert: {}", message);
    return false;
}

void CycleOrchestrator::notify_limit_reached(TimePoint now) {
    // Exhaustion reported right after a reset is stale provider data
    if (quota_.limit_alert_sent() || quota_.detect_sync_anomaly(now)) return;

    TimePoint resume = now + quota_.time_until_reset(now);
    std::string message = fmt::format("Rate limit reached: {}/{} calls used on {}, searches resume at {}",
                                      quota_.state().calls_used, quota_.settings().daily_ceiling,
                                      quota_.state().date, util::to_iso8601(resume));
    // Left unset on failure so the next skipped search tries again
    if (notify_operator(message, now)) {
        quota_.mark_limit_alert_sent(now);
    }
}

bool CycleOrchestrator::sleep_between_cycles(std::chrono::seconds interval) {
    state_ = CycleState::Sleeping;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(interval);

    while (remaining.count() > 0) {
        if (shutdown_.requested()) {
            return true;
        }
        auto step = std::min(remaining, settings_.sleep_tick);
        sleeper_(step);
        remaining -= step;
        heartbeat_.beat(clock_(), heartbeat_details());
    }
    return shutdown_.requested();
}

void CycleOrchestrator::persist_state() {
    if (!seen_.save()) {
        spdlog::error("Seen items not persisted this cycle");
    }
    if (!quota_.persist()) {
        spdlog::error("Quota state not persisted this cycle");
    }
}

void CycleOrchestrator::shutdown_sequence() {
    state_ = CycleState::ShuttingDown;
    spdlog::info("Shutdown requested, saving state");

    persist_state();
    shutdown_.clear();

    TimePoint now = clock_();
    heartbeat_.beat(now, heartbeat_details());
    publish_health();
    spdlog::info("Watcher stopped after {} cycles", cycles_);
}

void CycleOrchestrator::publish_health() {
    if (!health_) return;

    HealthSnapshot snap;
    snap.state = cycle_state_name(state_);
    snap.cycles = cycles_;
    snap.calls_used = quota_.state().calls_used;
    snap.daily_ceiling = quota_.settings().daily_ceiling;
    snap.seen_items = seen_.size();
    snap.consecutive_failures = consecutive_failures_;
    snap.last_cycle = last_cycle_at_;
    if (last_report_) {
        snap.last_new = last_report_->new_listings;
        snap.last_drops = last_report_->price_drops;
        snap.anomaly = last_report_->quota_anomaly;
    }
    health_->update(snap);
}
