// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "Error.hpp"

namespace bargein::json
{

/// @brief Parses a JSON document, returning a Result.
/// @param input The JSON text to parse.
/// @return The parsed JSON value or a ConfigError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the named member if it is an object, or an empty object otherwise.
[[nodiscard]] inline auto sectionOf(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_object())
        return obj[keyStr];
    return nlohmann::json::object();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional float field from a JSON object.
///
/// Integer literals are accepted as well (e.g. `"minConfidence": 1`).
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<float>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

} // namespace bargein::json
