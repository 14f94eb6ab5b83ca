#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    // Parses text and returns nullopt instead of throwing on malformed input.
    std::optional<nlohmann::json> TryParse(const std::string &text);

    std::optional<std::int64_t> GetInt64(const nlohmann::json &j, const std::string &key);
    std::int64_t GetInt64(const nlohmann::json &j, const std::string &key, std::int64_t fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
};
