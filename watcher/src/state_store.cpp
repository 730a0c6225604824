#include "state_store.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kWriteAttempts = 3;

bool write_and_sync(const std::string& tmp_path, const std::string& contents) {
    FILE* file = std::fopen(tmp_path.c_str(), "wb");
    if (!file) {
        spdlog::error("Cannot open {} for writing: {}", tmp_path, std::strerror(errno));
        return false;
    }

    bool ok = std::fwrite(contents.data(), 1, contents.size(), file) == contents.size();
    ok = ok && std::fflush(file) == 0;
    ok = ok && ::fsync(fileno(file)) == 0;
    if (!ok) {
        spdlog::error("Write to {} failed: {}", tmp_path, std::strerror(errno));
    }
    if (std::fclose(file) != 0) {
        ok = false;
    }
    return ok;
}

} // namespace

std::string StateStore::temp_path_for(const std::string& path) {
    return path + ".tmp";
}

std::optional<nlohmann::json> StateStore::read_document(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("State file {} not found", path);
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("State file {} is unreadable, using defaults", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        auto doc = nlohmann::json::parse(buffer.str());
        if (!doc.is_object()) {
            spdlog::error("State file {} is not a JSON object, using defaults", path);
            return std::nullopt;
        }
        return doc;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("State file {} is corrupt ({}), using defaults", path, e.what());
        return std::nullopt;
    }
}

bool StateStore::write_document(const std::string& path, const nlohmann::json& doc) {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create directory for {}: {}", path, ec.message());
            return false;
        }
    }

    const std::string tmp_path = temp_path_for(path);
    const std::string contents = doc.dump(2);

    for (int attempt = 1; attempt <= kWriteAttempts; ++attempt) {
        if (write_and_sync(tmp_path, contents)) {
            fs::rename(tmp_path, target, ec);
            if (!ec) {
                spdlog::debug("Saved {} ({} bytes)", path, contents.size());
                return true;
            }
            spdlog::error("Rename {} -> {} failed: {}", tmp_path, path, ec.message());
        }

        fs::remove(tmp_path, ec);
        if (attempt < kWriteAttempts) {
            spdlog::warn("Save of {} failed (attempt {}/{}), retrying", path, attempt, kWriteAttempts);
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    spdlog::error("Giving up on saving {}", path);
    return false;
}
