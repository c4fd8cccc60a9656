#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

const std::string* getStringFromObject(const nlohmann::json::object_t& object,
                                       std::string_view key);

// Returns the value of a non-empty string property, std::nullopt when the
// property is missing, has another type, or is blank.
std::optional<std::string> getNonEmptyString(
    const nlohmann::json::object_t& object, std::string_view key);

// Display properties default to an empty string.
std::string getStringOrEmpty(const nlohmann::json::object_t& object,
                             std::string_view key);
