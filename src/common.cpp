#include "common.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>

// ─────────────────────────────────────
std::int64_t NowEpochMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ─────────────────────────────────────
std::string ToIso8601(std::int64_t epoch_ms) {
    const std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    const int millis = static_cast<int>(epoch_ms % 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

// ─────────────────────────────────────
std::string StateName(CoordinatorState state) {
    switch (state) {
    case ACTIVE:
        return "ACTIVE";
    case STANDBY:
        return "STANDBY";
    case UNDECIDED:
    default:
        return "UNDECIDED";
    }
}

// ─────────────────────────────────────
void SetLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}
