#pragma once

#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Liveness file for external watchdogs: rewritten every cycle and every
// sleep tick so a stale timestamp means the process is stuck.
class Heartbeat {
public:
    Heartbeat(std::string path, std::string source, std::string version);

    bool beat(TimePoint now, const nlohmann::json& details = nlohmann::json::object());

    static std::optional<TimePoint> last_beat(const std::string& path);

private:
    std::string path_;
    std::string source_;
    std::string version_;
};
