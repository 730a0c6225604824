#include "heartbeat.hpp"
#include "state_store.hpp"
#include <spdlog/spdlog.h>

Heartbeat::Heartbeat(std::string path, std::string source, std::string version)
    : path_(std::move(path))
    , source_(std::move(source))
    , version_(std::move(version))
{}

bool Heartbeat::beat(TimePoint now, const nlohmann::json& details) {
    if (path_.empty()) return true;

    nlohmann::json doc = {
        {"schema", StateStore::kSchemaVersion},
        {"timestamp", util::to_epoch_seconds(now)},
        {"datetime", util::to_iso8601(now)},
        {"source", source_},
        {"version", version_}
    };
    if (details.is_object()) {
        for (const auto& [key, value] : details.items()) {
            doc[key] = value;
        }
    }

    if (!StateStore::write_document(path_, doc)) {
        spdlog::warn("Heartbeat write to {} failed", path_);
        return false;
    }
    return true;
}

std::optional<TimePoint> Heartbeat::last_beat(const std::string& path) {
    auto doc = StateStore::read_document(path);
    if (!doc || !doc->contains("timestamp") || !(*doc)["timestamp"].is_number_integer()) {
        return std::nullopt;
    }
    return util::from_epoch_seconds((*doc)["timestamp"].get<int64_t>());
}
