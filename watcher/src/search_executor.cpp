#include "search_executor.hpp"
#include <cmath>
#include <cstdio>
#include <spdlog/spdlog.h>

namespace {

std::string format_price(double value) {
    char buf[32];
    if (value == std::floor(value)) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f", value);
    }
    return buf;
}

std::optional<TimePoint> parse_reset_header(const std::string& value) {
    if (auto iso = util::parse_iso8601(value)) {
        return iso;
    }
    try {
        size_t used = 0;
        long long epoch = std::stoll(value, &used);
        if (used == value.size()) {
            return util::from_epoch_seconds(epoch);
        }
    } catch (const std::exception&) {
        spdlog::debug("Unrecognised rate-limit reset header: {}", value);
    }
    return std::nullopt;
}

} // namespace

SearchExecutor::SearchExecutor(HttpClient& http,
                               TokenManager& tokens,
                               QuotaTracker& quota,
                               ExecutorSettings settings,
                               Sleeper sleeper)
    : http_(http)
    , tokens_(tokens)
    , quota_(quota)
    , settings_(std::move(settings))
    , sleeper_(std::move(sleeper))
{}

std::string SearchExecutor::build_filter(const SearchSpec& spec) {
    std::vector<std::string> filters;

    std::string condition_ids = condition_filter_ids(spec.condition);
    if (!condition_ids.empty()) {
        filters.push_back("conditionIds:" + condition_ids);
    }

    if (spec.min_price > 0 || spec.has_upper_bound()) {
        std::string low = spec.min_price > 0 ? format_price(spec.min_price) : "";
        std::string high = spec.has_upper_bound()
            ? format_price(std::ceil(spec.max_price * kBestOfferBuffer))
            : "";
        filters.push_back("price:[" + low + ".." + high + "]");
        filters.push_back("priceCurrency:USD");
    }

    if (!spec.include_auctions) {
        filters.push_back("buyingOptions:{FIXED_PRICE}");
    }

    if (spec.free_shipping_only) {
        filters.push_back("maxDeliveryCost:0");
    }

    std::string joined;
    for (const auto& f : filters) {
        if (!joined.empty()) joined += ",";
        joined += f;
    }
    return joined;
}

std::string SearchExecutor::build_search_url(const SearchSpec& spec) const {
    std::string url = settings_.api_base + "/buy/browse/v1/item_summary/search"
        + "?q=" + url_escape(spec.query)
        + "&sort=newlyListed"
        + "&limit=" + std::to_string(settings_.results_limit);

    std::string filter = build_filter(spec);
    if (!filter.empty()) {
        url += "&filter=" + url_escape(filter);
    }
    return url;
}

HttpHeaders SearchExecutor::request_headers(const std::string& token) const {
    HttpHeaders headers = {
        "Authorization: Bearer " + token,
        "X-EBAY-C-MARKETPLACE-ID: " + settings_.marketplace_id,
        "Accept: application/json"
    };
    if (!settings_.epn_campaign_id.empty()) {
        headers.push_back("X-EBAY-C-ENDUSERCTX: affiliateCampaignId=" + settings_.epn_campaign_id);
    }
    return headers;
}

Outcome<std::vector<ListingResult>> SearchExecutor::execute(const SearchSpec& spec, TimePoint now) {
    using Result = Outcome<std::vector<ListingResult>>;
    last_attempts_ = 0;

    auto token = tokens_.get_valid_token(now);
    if (!token.ok()) {
        return Result::failure(token.error());
    }

    const std::string url = build_search_url(spec);
    int retries = 0;
    bool token_refreshed = false;

    while (true) {
        if (!quota_.can_spend(1)) {
            return Result::failure(ErrorKind::RateLimit, "daily call budget exhausted");
        }

        auto response = http_.get(url, request_headers(token.value()));
        ++last_attempts_;
        if (response.reached_server()) {
            quota_.record_spend(1, now);
        }
        sync_from_headers(response, now);

        if (response.is_success()) {
            return parse_results(spec, response, now);
        }

        if (response.status == 401) {
            if (token_refreshed) {
                return Result::failure(ErrorKind::Auth, "search rejected after token refresh", 401);
            }
            spdlog::warn("[{}] Token rejected, refreshing", spec.name);
            token_refreshed = true;
            tokens_.invalidate();
            token = tokens_.get_valid_token(now);
            if (!token.ok()) {
                return Result::failure(token.error());
            }
            continue;
        }

        bool transient = !response.reached_server() ||
                         response.status == 429 ||
                         response.status >= 500;
        if (!transient) {
            return Result::failure(ErrorKind::PermanentHttp,
                                   "search failed: " + response.body.substr(0, 200),
                                   response.status);
        }

        if (retries >= settings_.max_retries) {
            std::string message = !response.reached_server()
                ? "network error after retries: " + response.error
                : response.status == 429 ? "provider still throttling after retries"
                                         : "provider error after retries";
            return Result::failure(ErrorKind::TransientHttp, message, response.status);
        }

        auto delay = settings_.backoff_base * (1 << retries);
        spdlog::warn("[{}] Search attempt {} failed (HTTP {}), retrying in {}ms",
                     spec.name, last_attempts_, response.status, delay.count());
        sleeper_(delay);
        ++retries;
    }
}

Outcome<std::vector<ListingResult>> SearchExecutor::parse_results(const SearchSpec& spec,
                                                                  const HttpResponse& response,
                                                                  TimePoint now) const {
    using Result = Outcome<std::vector<ListingResult>>;

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        return Result::failure(ErrorKind::PermanentHttp,
                               std::string("malformed search response: ") + e.what(),
                               response.status);
    }

    if (!body.is_object()) {
        return Result::failure(ErrorKind::PermanentHttp, "search response is not an object",
                               response.status);
    }

    std::vector<ListingResult> listings;

    // The provider omits itemSummaries when nothing matched
    if (!body.contains("itemSummaries")) {
        if (!body.contains("total")) {
            return Result::failure(ErrorKind::PermanentHttp,
                                   "search response has neither itemSummaries nor total",
                                   response.status);
        }
        return Result::success(std::move(listings));
    }

    const auto& items = body.at("itemSummaries");
    if (!items.is_array()) {
        return Result::failure(ErrorKind::PermanentHttp, "itemSummaries is not an array",
                               response.status);
    }

    size_t dropped = 0;
    for (const auto& item : items) {
        auto listing = parse_listing(item);
        if (!listing || !listing->is_live(now)) {
            ++dropped;
            continue;
        }
        listings.push_back(std::move(*listing));
    }

    spdlog::debug("[{}] {} listings returned, {} unusable or ended", spec.name, listings.size(), dropped);
    return Result::success(std::move(listings));
}

void SearchExecutor::sync_from_headers(const HttpResponse& response, TimePoint now) {
    auto remaining = response.header("x-ratelimit-remaining");
    if (!remaining) {
        return;
    }

    try {
        int remaining_calls = std::stoi(*remaining);
        int limit = quota_.state().api_limit;
        if (auto limit_header = response.header("x-ratelimit-limit")) {
            limit = std::stoi(*limit_header);
        }

        std::optional<TimePoint> reset;
        if (auto reset_header = response.header("x-ratelimit-reset")) {
            reset = parse_reset_header(*reset_header);
        }
        quota_.sync_with_provider(limit, remaining_calls, reset, now);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring unparseable rate-limit headers: {}", e.what());
    }
}
