#pragma once

#include <chrono>
#include <cstdint>
#include <string>

enum CoordinatorState { UNDECIDED = 0, STANDBY = 1, ACTIVE = 2 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

#define HEARTBEAT_INTERVAL_MS 5000
// A heartbeat older than this belongs to a peer that is gone
#define STALE_THRESHOLD_MS 10000
#define GRACE_PERIOD_MS 5000

static constexpr unsigned kCoordinationPort = 58765;
static constexpr const char *kChannelName = "task-tracker-instances";
static constexpr const char *kAppName = "Local Task Tracker";

std::int64_t NowEpochMs();
std::string ToIso8601(std::int64_t epoch_ms);
std::string StateName(CoordinatorState state);
void SetLogLevel(LogLevel log_level);
