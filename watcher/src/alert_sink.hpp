#pragma once

#include "listing.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class AlertKind {
    NewListings,
    PriceDrops,
    Operator        // service condition for the operator, no items
};

struct AlertItem {
    ListingResult listing;
    std::optional<double> old_price;   // set for price drops
};

struct AlertBatch {
    AlertKind kind = AlertKind::NewListings;
    std::string search_name;
    std::vector<AlertItem> items;
    std::string message;               // operator alerts only

    bool empty() const { return items.empty() && message.empty(); }
};

AlertBatch operator_alert(std::string message);

nlohmann::json batch_to_json(const AlertBatch& batch, TimePoint now);

// Downstream notification hand-off. publish() returns false when the batch
// could not be delivered; the caller logs and moves on.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual bool publish(const AlertBatch& batch, TimePoint now) = 0;
};
