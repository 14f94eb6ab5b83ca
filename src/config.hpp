#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "common.hpp"

struct Config {
    std::filesystem::path lock_file;
    std::filesystem::path port_config;
    std::filesystem::path store_path;
    unsigned coordination_port = kCoordinationPort;
    std::string channel_name = kChannelName;
    std::string version = "1.0.0";
    LogLevel log_level = LOG_INFO;
    std::chrono::milliseconds grace_period{GRACE_PERIOD_MS};
};

// Defaults, then INSTANCEGUARD_* environment overrides.
Config LoadConfig();

// Consumes --debug / --quiet and returns the remaining arguments.
std::vector<std::string> ApplyCommandLine(Config &config, int argc, char **argv);

std::filesystem::path GetStorePath();
