#include "shutdown.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

ShutdownSignal::ShutdownSignal(std::string sentinel_path, const std::atomic<bool>* signal_flag)
    : sentinel_path_(std::move(sentinel_path))
    , signal_flag_(signal_flag)
{}

void ShutdownSignal::request() {
    requested_ = true;
}

bool ShutdownSignal::requested() const {
    if (requested_) return true;
    if (signal_flag_ && signal_flag_->load()) return true;
    if (sentinel_path_.empty()) return false;

    std::error_code ec;
    return fs::exists(sentinel_path_, ec);
}

void ShutdownSignal::clear() {
    requested_ = false;
    if (sentinel_path_.empty()) return;

    std::error_code ec;
    if (fs::remove(sentinel_path_, ec)) {
        spdlog::info("Removed shutdown sentinel {}", sentinel_path_);
    } else if (ec) {
        spdlog::warn("Could not remove shutdown sentinel {}: {}", sentinel_path_, ec.message());
    }
}
