#include "seen_store.hpp"
#include "state_store.hpp"
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

SeenStore::SeenStore(std::string path, size_t max_entries)
    : path_(std::move(path))
    , max_entries_(max_entries)
{}

void SeenStore::load() {
    items_.clear();
    dirty_ = false;

    auto doc = StateStore::read_document(path_);
    if (!doc) {
        spdlog::info("No seen-item history at {}, starting empty", path_);
        return;
    }

    auto schema = doc->find("schema");
    bool schema_ok = schema != doc->end() && schema->is_number_integer() &&
                     schema->get<int>() == StateStore::kSchemaVersion;
    if (!schema_ok || !doc->contains("items") || !(*doc)["items"].is_object()) {
        spdlog::error("Seen-item file {} has an unexpected layout, starting empty", path_);
        return;
    }

    size_t skipped = 0;
    for (const auto& [id, entry] : (*doc)["items"].items()) {
        try {
            SeenItem item;
            item.item_id = id;
            item.last_price = entry.at("price").get<double>();
            item.title = entry.value("title", "");

            auto first = util::parse_iso8601(entry.at("first_seen").get<std::string>());
            auto last = util::parse_iso8601(entry.at("last_seen").get<std::string>());
            if (!first || !last) {
                ++skipped;
                continue;
            }
            item.first_seen_at = *first;
            item.last_seen_at = *last;
            items_.emplace(id, std::move(item));
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Dropping seen entry {}: {}", id, e.what());
            ++skipped;
        }
    }

    if (skipped > 0) {
        spdlog::warn("Dropped {} malformed seen entries from {}", skipped, path_);
    }
    spdlog::info("Loaded {} seen items", items_.size());
}

bool SeenStore::save() {
    nlohmann::json entries = nlohmann::json::object();
    for (const auto& [id, item] : items_) {
        entries[id] = {
            {"price", item.last_price},
            {"first_seen", util::to_iso8601(item.first_seen_at)},
            {"last_seen", util::to_iso8601(item.last_seen_at)},
            {"title", item.title}
        };
    }

    nlohmann::json doc = {
        {"schema", StateStore::kSchemaVersion},
        {"items", entries}
    };

    if (!StateStore::write_document(path_, doc)) {
        spdlog::error("Failed to save seen items");
        return false;
    }
    dirty_ = false;
    return true;
}

std::optional<SeenItem> SeenStore::lookup(const std::string& item_id) const {
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> SeenStore::record_seen(const std::string& item_id, double price,
                                             TimePoint now, const std::string& title) {
    dirty_ = true;

    auto it = items_.find(item_id);
    if (it == items_.end()) {
        SeenItem item;
        item.item_id = item_id;
        item.last_price = price;
        item.first_seen_at = now;
        item.last_seen_at = now;
        item.title = title.substr(0, 100);
        items_.emplace(item_id, std::move(item));
        return std::nullopt;
    }

    double previous = it->second.last_price;
    it->second.last_price = price;
    it->second.last_seen_at = now;
    return previous;
}

size_t SeenStore::evict_expired(TimePoint now, int max_age_days) {
    const auto max_age = std::chrono::hours(24 * max_age_days);
    size_t removed = 0;

    for (auto it = items_.begin(); it != items_.end();) {
        if (now - it->second.last_seen_at > max_age) {
            it = items_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        dirty_ = true;
        spdlog::info("Evicted {} seen items older than {} days", removed, max_age_days);
    }
    return removed;
}

size_t SeenStore::enforce_cap() {
    if (items_.size() <= max_entries_) {
        return 0;
    }

    std::vector<std::pair<TimePoint, std::string>> by_age;
    by_age.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        by_age.emplace_back(item.last_seen_at, id);
    }

    size_t excess = items_.size() - max_entries_;
    std::nth_element(by_age.begin(), by_age.begin() + excess, by_age.end());
    for (size_t i = 0; i < excess; ++i) {
        items_.erase(by_age[i].second);
    }

    dirty_ = true;
    spdlog::warn("Seen-item cap {} exceeded, dropped {} oldest entries", max_entries_, excess);
    return excess;
}
