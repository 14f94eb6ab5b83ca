#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// Identity of the server process that created the lock file. timestamp is the creation time in
// epoch milliseconds, not a heartbeat.
struct LockRecord {
    int pid = 0;
    std::string start_time;
    std::string version;
    std::int64_t timestamp = 0;
};

nlohmann::json ToJson(const LockRecord &record);
std::optional<LockRecord> LockRecordFromJson(const nlohmann::json &j);

// Missing, unreadable and corrupt files all read as nullopt.
std::optional<LockRecord> ReadLockFile(const std::filesystem::path &path);
bool WriteLockFile(const std::filesystem::path &path, const LockRecord &record);

// Removes path if it exists. Returns true when the file is gone afterwards.
bool RemoveFileIfExists(const std::filesystem::path &path, bool *removed = nullptr);
