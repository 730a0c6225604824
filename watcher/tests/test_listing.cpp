#include <catch2/catch_test_macros.hpp>
#include "../src/alert_sink.hpp"
#include "../src/listing.hpp"
#include "fakes.hpp"

TEST_CASE("Listing parsing", "[listing]") {
    const TimePoint now = at("2026-07-15T18:00:00Z");

    nlohmann::json item = {
        {"itemId", "v1|1234|0"},
        {"title", "Acme Widget Pro"},
        {"price", {{"value", "39.99"}, {"currency", "USD"}}},
        {"itemWebUrl", "https://www.ebay.com/itm/1234"},
        {"itemAffiliateWebUrl", "https://www.ebay.com/itm/1234?campid=42"},
        {"condition", "Used"},
        {"itemCreationDate", "2026-07-15T17:30:00.000Z"},
        {"buyingOptions", {"FIXED_PRICE", "BEST_OFFER"}},
        {"itemLocation", {{"country", "US"}, {"stateOrProvince", "Oregon"}}},
        {"seller", {{"username", "acme_outlet"}, {"feedbackPercentage", "99.2"}, {"feedbackScore", 1843}}},
        {"shippingOptions", {{{"shippingCost", {{"value", "0.00"}, {"currency", "USD"}}}}}},
        {"image", {{"imageUrl", "https://i.ebayimg.com/1234.jpg"}}}
    };

    SECTION("Full item summary") {
        auto listing = parse_listing(item);
        REQUIRE(listing.has_value());
        REQUIRE(listing->item_id == "v1|1234|0");
        REQUIRE(listing->price == 39.99);
        REQUIRE(listing->currency == "USD");
        REQUIRE(listing->best_offer());
        REQUIRE_FALSE(listing->auction_only());
        REQUIRE(listing->created_at == at("2026-07-15T17:30:00Z"));
        REQUIRE(listing->shipping_cost == 0.0);
        REQUIRE(listing->location_country == "US");
        REQUIRE(listing->location_region == "Oregon");
        REQUIRE(listing->seller_feedback_pct == 99.2);
        REQUIRE(listing->seller_feedback_score == 1843);
        REQUIRE(listing->is_live(now));

        auto json = listing_to_json(*listing);
        REQUIRE(json["region"] == "Oregon");
        REQUIRE(json["seller_feedback_pct"] == 99.2);
        REQUIRE(json["seller_feedback_score"] == 1843);
    }

    SECTION("Seller and region are optional") {
        item.erase("seller");
        item["itemLocation"] = {{"country", "US"}};
        auto listing = parse_listing(item);
        REQUIRE(listing.has_value());
        REQUIRE(listing->location_region.empty());
        REQUIRE_FALSE(listing->seller_feedback_pct);
        REQUIRE_FALSE(listing->seller_feedback_score);
        REQUIRE_FALSE(listing_to_json(*listing).contains("seller_feedback_pct"));
    }

    SECTION("Fields of the wrong type skip the item") {
        auto null_title = item;
        null_title["title"] = nullptr;
        REQUIRE_FALSE(parse_listing(null_title).has_value());

        auto numeric_url = item;
        numeric_url["itemWebUrl"] = 42;
        REQUIRE_FALSE(parse_listing(numeric_url).has_value());

        auto null_id = item;
        null_id["itemId"] = nullptr;
        REQUIRE_FALSE(parse_listing(null_id).has_value());

        auto bad_availability = item;
        bad_availability["estimatedAvailabilities"] = nlohmann::json::array({"IN_STOCK"});
        REQUIRE_FALSE(parse_listing(bad_availability).has_value());
    }

    SECTION("Affiliate link is preferred") {
        auto listing = parse_listing(item);
        REQUIRE(listing->link() == "https://www.ebay.com/itm/1234?campid=42");

        item.erase("itemAffiliateWebUrl");
        listing = parse_listing(item);
        REQUIRE(listing->link() == "https://www.ebay.com/itm/1234");
    }

    SECTION("Numeric prices are accepted") {
        item["price"]["value"] = 12.5;
        REQUIRE(parse_listing(item)->price == 12.5);
    }

    SECTION("Items without id or price are skipped") {
        auto no_price = item;
        no_price.erase("price");
        REQUIRE_FALSE(parse_listing(no_price).has_value());

        auto no_id = item;
        no_id.erase("itemId");
        REQUIRE_FALSE(parse_listing(no_id).has_value());
    }

    SECTION("Ended listings are not live") {
        item["itemEndDate"] = "2026-07-15T17:59:00Z";
        REQUIRE_FALSE(parse_listing(item)->is_live(now));

        item["itemEndDate"] = "2026-07-20T00:00:00Z";
        REQUIRE(parse_listing(item)->is_live(now));
    }

    SECTION("Out of stock listings are not live") {
        item["estimatedAvailabilities"] = nlohmann::json::array({{{"estimatedAvailabilityStatus", "OUT_OF_STOCK"}}});
        REQUIRE_FALSE(parse_listing(item)->is_live(now));

        item["estimatedAvailabilities"] = nlohmann::json::array({{{"estimatedAvailabilityStatus", "IN_STOCK"}}});
        REQUIRE(parse_listing(item)->is_live(now));
    }
}

TEST_CASE("Alert batch payload", "[alerts]") {
    const TimePoint now = at("2026-07-15T18:00:00Z");

    ListingResult listing;
    listing.item_id = "X123";
    listing.title = "Acme Widget Pro";
    listing.price = 40.0;
    listing.url = "https://www.ebay.com/itm/X123";

    SECTION("Price drop batch") {
        AlertBatch batch;
        batch.kind = AlertKind::PriceDrops;
        batch.search_name = "Widget";
        batch.items.push_back({listing, 50.0});

        auto json = batch_to_json(batch, now);
        REQUIRE(json["kind"] == "price_drops");
        REQUIRE(json["search"] == "Widget");
        REQUIRE(json["count"] == 1);
        REQUIRE(json["ts"] == "2026-07-15T18:00:00Z");
        REQUIRE(json["text"] == "1 price drop for Widget");
        REQUIRE(json["items"][0]["id"] == "X123");
        REQUIRE(json["items"][0]["old_price"] == 50.0);
        REQUIRE(json["items"][0]["drop_pct"] == 20.0);
    }

    SECTION("New listing batch") {
        AlertBatch batch;
        batch.search_name = "Widget";
        batch.items.push_back({listing, std::nullopt});
        batch.items.push_back({listing, std::nullopt});

        auto json = batch_to_json(batch, now);
        REQUIRE(json["kind"] == "new_listings");
        REQUIRE(json["text"] == "2 new listings for Widget");
        REQUIRE_FALSE(json["items"][0].contains("old_price"));
        REQUIRE(json["items"][1]["link"] == "https://www.ebay.com/itm/X123");
    }

    SECTION("Operator batch carries only its message") {
        auto batch = operator_alert("Every search has failed for 3 cycles in a row");
        REQUIRE_FALSE(batch.empty());

        auto json = batch_to_json(batch, now);
        REQUIRE(json["kind"] == "operator");
        REQUIRE(json["text"] == "Every search has failed for 3 cycles in a row");
        REQUIRE(json["count"] == 0);
        REQUIRE(json["items"].empty());
    }
}
