#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

// Whole-document JSON persistence for the watcher's state files.
//
// Every document carries a "schema" field. Loads never throw: a missing file,
// a parse error, a schema mismatch or a document of the wrong shape all yield
// the caller's default. Saves write a sibling temp file, flush and fsync it,
// then rename it over the target so a crash never leaves a half-written file.
class StateStore {
public:
    static constexpr int kSchemaVersion = 1;

    static std::optional<nlohmann::json> read_document(const std::string& path);
    static bool write_document(const std::string& path, const nlohmann::json& doc);

    static std::string temp_path_for(const std::string& path);

    template <typename T>
    static T load(const std::string& path, const T& fallback) {
        auto doc = read_document(path);
        if (!doc) {
            return fallback;
        }
        try {
            int schema = doc->value("schema", 0);
            if (schema != kSchemaVersion) {
                spdlog::error("State file {} has schema {} (expected {}), using defaults",
                              path, schema, kSchemaVersion);
                return fallback;
            }
            return doc->get<T>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("State file {} is corrupt ({}), using defaults", path, e.what());
            return fallback;
        }
    }

    template <typename T>
    static bool save(const std::string& path, const T& value) {
        nlohmann::json doc = value;
        doc["schema"] = kSchemaVersion;
        return write_document(path, doc);
    }
};
