#pragma once

#include "errors.hpp"
#include "http_client.hpp"
#include "listing.hpp"
#include "quota_tracker.hpp"
#include "search_spec.hpp"
#include "token_manager.hpp"
#include "util.hpp"
#include <chrono>
#include <string>
#include <vector>

struct ExecutorSettings {
    std::string api_base = "https://api.ebay.com";
    std::string marketplace_id = "EBAY_US";
    std::string epn_campaign_id;
    int results_limit = 150;
    int max_retries = 2;
    std::chrono::milliseconds backoff_base{1000};
};

// Runs one search against the provider's browse endpoint. Each attempt that
// reaches the provider is charged to the quota before the next one starts;
// an attempt is never made without budget for it.
class SearchExecutor {
public:
    SearchExecutor(HttpClient& http,
                   TokenManager& tokens,
                   QuotaTracker& quota,
                   ExecutorSettings settings,
                   Sleeper sleeper);

    Outcome<std::vector<ListingResult>> execute(const SearchSpec& spec, TimePoint now);

    std::string build_search_url(const SearchSpec& spec) const;
    static std::string build_filter(const SearchSpec& spec);

    // Attempts made by the most recent execute()
    int last_attempts() const { return last_attempts_; }

private:
    HttpClient& http_;
    TokenManager& tokens_;
    QuotaTracker& quota_;
    ExecutorSettings settings_;
    Sleeper sleeper_;
    int last_attempts_ = 0;

    HttpHeaders request_headers(const std::string& token) const;
    Outcome<std::vector<ListingResult>> parse_results(const SearchSpec& spec,
                                                      const HttpResponse& response,
                                                      TimePoint now) const;
    void sync_from_headers(const HttpResponse& response, TimePoint now);
};
