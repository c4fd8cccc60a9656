#include "records.hpp"

#include "../json_utils.hpp"

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <optional>
#include <string>

namespace xcvr_compat
{

static const nlohmann::json::object_t* asObject(const nlohmann::json& row,
                                                const char* relation)
{
    const auto* obj = row.get_ptr<const nlohmann::json::object_t*>();
    if (obj == nullptr)
    {
        lg2::debug("{RELATION} row was not an object", "RELATION", relation);
    }
    return obj;
}

static void setIfPresent(nlohmann::json::object_t& out, const char* key,
                         const std::optional<std::string>& value)
{
    if (value)
    {
        out[key] = *value;
    }
}

Product Product::fromJson(const nlohmann::json& row)
{
    Product product;

    const nlohmann::json::object_t* obj = asObject(row, "Products");
    if (obj == nullptr)
    {
        return product;
    }

    product.skuId = getNonEmptyString(*obj, keys::sku);
    product.oemPartNumber = getNonEmptyString(*obj, keys::oemPartNumber);
    product.description = getStringOrEmpty(*obj, keys::description);
    product.rate = getStringOrEmpty(*obj, keys::rate);
    product.formFactor = getStringOrEmpty(*obj, keys::formFactor);
    product.reach = getStringOrEmpty(*obj, keys::reach);
    product.cableType = getStringOrEmpty(*obj, keys::cableType);
    product.media = getStringOrEmpty(*obj, keys::media);
    product.connectorType = getStringOrEmpty(*obj, keys::connectorType);
    product.wavelength = getStringOrEmpty(*obj, keys::wavelength);
    product.caseTemp = getStringOrEmpty(*obj, keys::caseTemp);
    product.productPageUrl = getStringOrEmpty(*obj, keys::productPageUrl);

    return product;
}

nlohmann::json::object_t Product::toJson() const
{
    nlohmann::json::object_t res;

    setIfPresent(res, keys::sku, skuId);
    setIfPresent(res, keys::oemPartNumber, oemPartNumber);
    res[keys::description] = description;
    res[keys::rate] = rate;
    res[keys::formFactor] = formFactor;
    res[keys::reach] = reach;
    res[keys::cableType] = cableType;
    res[keys::media] = media;
    res[keys::connectorType] = connectorType;
    res[keys::wavelength] = wavelength;
    res[keys::caseTemp] = caseTemp;
    res[keys::productPageUrl] = productPageUrl;

    return res;
}

CompatibilityEntry CompatibilityEntry::fromJson(const nlohmann::json& row)
{
    CompatibilityEntry entry;

    const nlohmann::json::object_t* obj = asObject(row, "Compatibility");
    if (obj == nullptr)
    {
        return entry;
    }

    entry.deviceId = getNonEmptyString(*obj, keys::deviceId);
    entry.oemPartNumber = getNonEmptyString(*obj, keys::oemPartNumber);
    entry.description = getNonEmptyString(*obj, keys::description);

    return entry;
}

nlohmann::json::object_t CompatibilityEntry::toJson() const
{
    nlohmann::json::object_t res;

    setIfPresent(res, keys::deviceId, deviceId);
    setIfPresent(res, keys::oemPartNumber, oemPartNumber);
    setIfPresent(res, keys::description, description);

    return res;
}

SwitchBayEntry SwitchBayEntry::fromJson(const nlohmann::json& row)
{
    SwitchBayEntry entry;

    const nlohmann::json::object_t* obj = asObject(row, "SwitchBays");
    if (obj == nullptr)
    {
        return entry;
    }

    entry.switchModel = getNonEmptyString(*obj, keys::switchModel);

    std::optional<std::string> module =
        getNonEmptyString(*obj, keys::supportedModuleId);
    if (module)
    {
        entry.supportedModule.emplace(*module);
    }

    return entry;
}

nlohmann::json::object_t SwitchBayEntry::toJson() const
{
    nlohmann::json::object_t res;

    setIfPresent(res, keys::switchModel, switchModel);
    if (supportedModule)
    {
        res[keys::supportedModuleId] = supportedModule->raw();
    }

    return res;
}

} // namespace xcvr_compat
