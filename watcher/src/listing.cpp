#include "listing.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace {

// Numbers arrive either as JSON numbers or as decimal strings
std::optional<double> parse_number(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str()) return parsed;
    }
    return std::nullopt;
}

std::optional<double> parse_amount(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("value")) return std::nullopt;
    return parse_number(j.at("value"));
}

std::optional<TimePoint> parse_time_field(const nlohmann::json& item, const char* key) {
    if (!item.contains(key) || !item.at(key).is_string()) return std::nullopt;
    return util::parse_iso8601(item.at(key).get<std::string>());
}

bool has_option(const std::vector<std::string>& options, const char* name) {
    return std::find(options.begin(), options.end(), name) != options.end();
}

} // namespace

bool ListingResult::best_offer() const {
    return has_option(buying_options, "BEST_OFFER");
}

bool ListingResult::auction_only() const {
    return has_option(buying_options, "AUCTION") && !has_option(buying_options, "FIXED_PRICE");
}

const std::string& ListingResult::link() const {
    if (affiliate_url && !affiliate_url->empty()) {
        return *affiliate_url;
    }
    return url;
}

bool ListingResult::is_live(TimePoint now) const {
    if (end_date && *end_date <= now) {
        return false;
    }
    return availability != "OUT_OF_STOCK";
}

std::optional<ListingResult> parse_listing(const nlohmann::json& item) {
    if (!item.is_object()) return std::nullopt;

    ListingResult listing;
    try {
        listing.item_id = item.value("itemId", "");
        if (listing.item_id.empty()) return std::nullopt;

        auto price = item.contains("price") ? parse_amount(item.at("price")) : std::nullopt;
        if (!price) return std::nullopt;
        listing.price = *price;
        listing.currency = item.at("price").value("currency", "USD");

        listing.title = item.value("title", "");
        listing.url = item.value("itemWebUrl", "");
        if (item.contains("itemAffiliateWebUrl") && item.at("itemAffiliateWebUrl").is_string()) {
            listing.affiliate_url = item.at("itemAffiliateWebUrl").get<std::string>();
        }
        listing.condition = item.value("condition", "");
        listing.created_at = parse_time_field(item, "itemCreationDate");
        listing.end_date = parse_time_field(item, "itemEndDate");

        if (item.contains("estimatedAvailabilities") && item.at("estimatedAvailabilities").is_array() &&
            !item.at("estimatedAvailabilities").empty()) {
            listing.availability =
                item.at("estimatedAvailabilities")[0].value("estimatedAvailabilityStatus", "");
        }

        if (item.contains("itemLocation") && item.at("itemLocation").is_object()) {
            const auto& location = item.at("itemLocation");
            listing.location_country = location.value("country", "");
            listing.location_region = location.value("stateOrProvince", "");
        }

        if (item.contains("shippingOptions") && item.at("shippingOptions").is_array() &&
            !item.at("shippingOptions").empty()) {
            const auto& first = item.at("shippingOptions")[0];
            if (first.contains("shippingCost")) {
                listing.shipping_cost = parse_amount(first.at("shippingCost"));
            }
        }

        if (item.contains("seller") && item.at("seller").is_object()) {
            const auto& seller = item.at("seller");
            if (seller.contains("feedbackPercentage")) {
                listing.seller_feedback_pct = parse_number(seller.at("feedbackPercentage"));
            }
            if (seller.contains("feedbackScore") && seller.at("feedbackScore").is_number_integer()) {
                listing.seller_feedback_score = seller.at("feedbackScore").get<int>();
            }
        }

        if (item.contains("image") && item.at("image").is_object()) {
            listing.image_url = item.at("image").value("imageUrl", "");
        }

        if (item.contains("buyingOptions") && item.at("buyingOptions").is_array()) {
            for (const auto& option : item.at("buyingOptions")) {
                if (option.is_string()) listing.buying_options.push_back(option.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Skipping item summary {}: {}", listing.item_id.empty() ? "?" : listing.item_id, e.what());
        return std::nullopt;
    }

    return listing;
}

nlohmann::json listing_to_json(const ListingResult& listing) {
    nlohmann::json j = {
        {"id", listing.item_id},
        {"title", listing.title},
        {"price", listing.price},
        {"currency", listing.currency},
        {"link", listing.link()},
        {"condition", listing.condition},
        {"best_offer", listing.best_offer()},
        {"location", listing.location_country}
    };
    if (!listing.location_region.empty()) {
        j["region"] = listing.location_region;
    }
    if (listing.seller_feedback_pct) {
        j["seller_feedback_pct"] = *listing.seller_feedback_pct;
    }
    if (listing.seller_feedback_score) {
        j["seller_feedback_score"] = *listing.seller_feedback_score;
    }
    if (listing.created_at) {
        j["created_at"] = util::to_iso8601(*listing.created_at);
    }
    if (listing.shipping_cost) {
        j["shipping_cost"] = *listing.shipping_cost;
    }
    if (!listing.image_url.empty()) {
        j["image"] = listing.image_url;
    }
    return j;
}
