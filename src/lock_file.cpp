#include "lock_file.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

// ─────────────────────────────────────
nlohmann::json ToJson(const LockRecord &record) {
    return nlohmann::json{{"pid", record.pid},
                          {"timestamp", record.timestamp},
                          {"startTime", record.start_time},
                          {"version", record.version}};
}

// ─────────────────────────────────────
std::optional<LockRecord> LockRecordFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    JsonParse parse;
    auto pid = parse.GetInt64(j, "pid");
    auto timestamp = parse.GetInt64(j, "timestamp");
    if (!pid || !timestamp) {
        return std::nullopt;
    }
    const auto &rawPid = j.at("pid");
    if (rawPid.is_number_float() && std::trunc(rawPid.get<double>()) != rawPid.get<double>()) {
        spdlog::warn("Lock file names fractional pid {}", rawPid.get<double>());
        return std::nullopt;
    }
    if (*pid <= 0 || *pid > std::numeric_limits<int>::max()) {
        spdlog::warn("Lock file names invalid pid {}", *pid);
        return std::nullopt;
    }

    LockRecord record;
    record.pid = static_cast<int>(*pid);
    record.timestamp = *timestamp;
    record.start_time = parse.GetString(j, "startTime", "");
    record.version = parse.GetString(j, "version", "unknown");
    return record;
}

// ─────────────────────────────────────
std::optional<LockRecord> ReadLockFile(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Lock file {} exists but cannot be read", path.string());
        return std::nullopt;
    }

    std::stringstream content;
    content << file.rdbuf();

    JsonParse parse;
    auto j = parse.TryParse(content.str());
    if (!j) {
        spdlog::warn("Lock file {} is not valid JSON, treating as absent", path.string());
        return std::nullopt;
    }

    auto record = LockRecordFromJson(*j);
    if (!record) {
        spdlog::warn("Lock file {} lacks a valid pid or timestamp, treating as absent", path.string());
    }
    return record;
}

// ─────────────────────────────────────
bool WriteLockFile(const std::filesystem::path &path, const LockRecord &record) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Cannot write lock file {}", path.string());
        return false;
    }
    file << ToJson(record).dump(2);
    file.close();
    if (!file) {
        spdlog::error("Failed writing lock file {}", path.string());
        return false;
    }
    spdlog::debug("Lock file created: {}", path.string());
    return true;
}

// ─────────────────────────────────────
bool RemoveFileIfExists(const std::filesystem::path &path, bool *removed) {
    std::error_code ec;
    const bool didRemove = std::filesystem::remove(path, ec);
    if (removed) {
        *removed = didRemove;
    }
    if (ec) {
        spdlog::error("Failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}
