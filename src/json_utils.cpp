#include "json_utils.hpp"

#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <optional>
#include <string>
#include <string_view>

const std::string* getStringFromObject(const nlohmann::json::object_t& object,
                                       std::string_view key)
{
    auto it = object.find(key);
    if (it == object.end())
    {
        lg2::debug("Unable to find {KEY}", "KEY", key);
        return nullptr;
    }
    return it->second.get_ptr<const std::string*>();
}

std::optional<std::string> getNonEmptyString(
    const nlohmann::json::object_t& object, std::string_view key)
{
    const std::string* ptr = getStringFromObject(object, key);
    if (ptr == nullptr || trimView(*ptr).empty())
    {
        return std::nullopt;
    }
    return *ptr;
}

std::string getStringOrEmpty(const nlohmann::json::object_t& object,
                             std::string_view key)
{
    const std::string* ptr = getStringFromObject(object, key);
    if (ptr == nullptr)
    {
        return {};
    }
    return *ptr;
}
