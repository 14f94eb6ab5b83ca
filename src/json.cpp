#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

// ─────────────────────────────────────
std::optional<nlohmann::json> JsonParse::TryParse(const std::string &text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::debug("JsonParse: Invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<std::int64_t> JsonParse::GetInt64(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found", key);
        return std::nullopt;
    }
    if (j.at(key).is_number_unsigned() &&
        j.at(key).get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        spdlog::warn("JsonParse: Key '{}' is out of integer range", key);
        return std::nullopt;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<std::int64_t>();
    }
    if (j.at(key).is_number_float()) {
        const double d = j.at(key).get<double>();
        // 2^63 is exactly representable; anything at or past it does not fit.
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            spdlog::warn("JsonParse: Key '{}' is out of integer range", key);
            return std::nullopt;
        }
        auto val = static_cast<std::int64_t>(d);
        spdlog::debug("JsonParse: Converted double to int for key '{}': {}", key, val);
        return val;
    }
    spdlog::warn("JsonParse: Key '{}' is not a number", key);
    return std::nullopt;
}

// ─────────────────────────────────────
std::int64_t JsonParse::GetInt64(const nlohmann::json &j, const std::string &key,
                                 std::int64_t fallback) {
    return GetInt64(j, key).value_or(fallback);
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}
