#include "config.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>

namespace {
static const char *getenv_nonempty(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}
} // namespace

// ─────────────────────────────────────
std::filesystem::path GetStorePath() {
    const char *xdgDataHome = getenv_nonempty("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        const char *home = getenv_nonempty("HOME");
        if (!home) {
            spdlog::warn("HOME environment variable not set, storing state in working directory");
            return std::filesystem::current_path() / "instances.sqlite";
        }
        baseDir = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path storePath = baseDir / "InstanceGuard" / "instances.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(storePath.parent_path(), ec);
    if (ec) {
        spdlog::error("Error creating directories: {}", ec.message());
    }

    return storePath;
}

// ─────────────────────────────────────
Config LoadConfig() {
    Config config;
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }

    config.lock_file = cwd / ".app-instance.lock";
    config.port_config = cwd / "port-config.json";

    if (const char *v = getenv_nonempty("INSTANCEGUARD_LOCK_FILE")) {
        config.lock_file = v;
    }
    if (const char *v = getenv_nonempty("INSTANCEGUARD_PORT_CONFIG")) {
        config.port_config = v;
    }
    if (const char *v = getenv_nonempty("INSTANCEGUARD_STORE")) {
        config.store_path = v;
    } else {
        config.store_path = GetStorePath();
    }
    if (const char *v = getenv_nonempty("INSTANCEGUARD_CHANNEL")) {
        config.channel_name = v;
    }
    if (const char *v = getenv_nonempty("INSTANCEGUARD_VERSION")) {
        config.version = v;
    }

    if (const char *v = getenv_nonempty("INSTANCEGUARD_PORT")) {
        const std::string text(v);
        unsigned port = 0;
        auto [ptr, err] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (err != std::errc() || ptr != text.data() + text.size() || port == 0 || port > 65535) {
            spdlog::warn("Invalid INSTANCEGUARD_PORT '{}', using {}", text, kCoordinationPort);
        } else {
            config.coordination_port = port;
        }
    }

    if (const char *v = getenv_nonempty("INSTANCEGUARD_LOG")) {
        const std::string level(v);
        if (level == "debug") {
            config.log_level = LOG_DEBUG;
        } else if (level == "off") {
            config.log_level = LOG_OFF;
        } else {
            config.log_level = LOG_INFO;
        }
    }

    return config;
}

// ─────────────────────────────────────
std::vector<std::string> ApplyCommandLine(Config &config, int argc, char **argv) {
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--debug") {
            config.log_level = LOG_DEBUG;
        } else if (arg == "--quiet") {
            config.log_level = LOG_OFF;
        } else {
            rest.push_back(arg);
        }
    }
    return rest;
}
