#pragma once

#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ListingResult {
    std::string item_id;
    std::string title;
    double price = 0.0;
    std::string currency;
    std::string url;
    std::optional<std::string> affiliate_url;
    std::string condition;
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> end_date;
    std::string availability;          // e.g. IN_STOCK, empty when not reported
    std::string location_country;
    std::string location_region;       // state or province
    std::optional<double> shipping_cost;
    std::string image_url;
    std::optional<double> seller_feedback_pct;
    std::optional<int> seller_feedback_score;
    std::vector<std::string> buying_options;

    bool best_offer() const;
    bool auction_only() const;

    // Affiliate link when one was issued, plain item page otherwise
    const std::string& link() const;

    // Not ended and not reported out of stock
    bool is_live(TimePoint now) const;
};

// Maps one itemSummaries entry; nullopt when id or price is missing or a
// field has an unexpected type
std::optional<ListingResult> parse_listing(const nlohmann::json& item);

nlohmann::json listing_to_json(const ListingResult& listing);
