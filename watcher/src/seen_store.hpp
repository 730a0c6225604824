#pragma once

#include "util.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

struct SeenItem {
    std::string item_id;
    double last_price = 0.0;
    TimePoint first_seen_at{};
    TimePoint last_seen_at{};
    std::string title;
};

// Memory of listings already observed, keyed by provider item id. Used to
// suppress repeat alerts and to spot price drops. Entries not seen for the
// retention period are evicted; the map is also capped in size.
class SeenStore {
public:
    static constexpr size_t kDefaultMaxEntries = 50000;
    static constexpr int kDefaultRetentionDays = 14;

    explicit SeenStore(std::string path, size_t max_entries = kDefaultMaxEntries);

    void load();
    bool save();

    std::optional<SeenItem> lookup(const std::string& item_id) const;

    // Records the sighting and returns the price seen before, if any
    std::optional<double> record_seen(const std::string& item_id, double price,
                                      TimePoint now, const std::string& title = "");

    size_t evict_expired(TimePoint now, int max_age_days = kDefaultRetentionDays);
    size_t enforce_cap();

    size_t size() const { return items_.size(); }
    bool dirty() const { return dirty_; }

private:
    std::string path_;
    size_t max_entries_;
    std::unordered_map<std::string, SeenItem> items_;
    bool dirty_ = false;
};
