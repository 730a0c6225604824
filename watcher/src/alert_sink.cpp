#include "alert_sink.hpp"
#include <cmath>
#include <fmt/format.h>

nlohmann::json batch_to_json(const AlertBatch& batch, TimePoint now) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : batch.items) {
        nlohmann::json entry = listing_to_json(item.listing);
        if (item.old_price && *item.old_price > 0) {
            entry["old_price"] = *item.old_price;
            double drop = (*item.old_price - item.listing.price) / *item.old_price * 100.0;
            entry["drop_pct"] = std::round(drop * 10.0) / 10.0;
        }
        items.push_back(entry);
    }

    std::string text;
    const char* kind = "new_listings";
    switch (batch.kind) {
        case AlertKind::NewListings:
            text = fmt::format("{} new listing{} for {}", batch.items.size(),
                               batch.items.size() == 1 ? "" : "s", batch.search_name);
            break;
        case AlertKind::PriceDrops:
            kind = "price_drops";
            text = fmt::format("{} price drop{} for {}", batch.items.size(),
                               batch.items.size() == 1 ? "" : "s", batch.search_name);
            break;
        case AlertKind::Operator:
            kind = "operator";
            text = batch.message;
            break;
    }

    return {
        {"kind", kind},
        {"search", batch.search_name},
        {"count", batch.items.size()},
        {"text", text},
        {"items", items},
        {"ts", util::to_iso8601(now)}
    };
}

AlertBatch operator_alert(std::string message) {
    AlertBatch batch;
    batch.kind = AlertKind::Operator;
    batch.message = std::move(message);
    return batch;
}
