#pragma once

#include "slot_id.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace xcvr_compat
{

// Key names used by the dataset document.
namespace keys
{
constexpr const char* sku = "Your_SKU";
constexpr const char* oemPartNumber = "OEM_Part_Number";
constexpr const char* description = "Description";
constexpr const char* rate = "Rate";
constexpr const char* formFactor = "Form_Factor";
constexpr const char* reach = "Reach";
constexpr const char* cableType = "Cable_Type";
constexpr const char* media = "Media";
constexpr const char* connectorType = "Connector_Type";
constexpr const char* wavelength = "Wavelength";
constexpr const char* caseTemp = "Case_Temp";
constexpr const char* productPageUrl = "Product_Page_URL";
constexpr const char* deviceId = "Device_ID";
constexpr const char* switchModel = "Switch_Model";
constexpr const char* supportedModuleId = "Supported_Module_ID";
} // namespace keys

// Record parsing never fails. A key which is missing, is not a string or is
// blank is left empty, and a row which is not an object has every key empty.

struct Product
{
    static Product fromJson(const nlohmann::json& row);
    nlohmann::json::object_t toJson() const;

    std::optional<std::string> skuId;
    std::optional<std::string> oemPartNumber;

    std::string description;
    std::string rate;
    std::string formFactor;
    std::string reach;
    std::string cableType;
    std::string media;
    std::string connectorType;
    std::string wavelength;
    std::string caseTemp;
    std::string productPageUrl;

    bool operator==(const Product&) const = default;
};

struct CompatibilityEntry
{
    static CompatibilityEntry fromJson(const nlohmann::json& row);
    nlohmann::json::object_t toJson() const;

    std::optional<std::string> deviceId;
    std::optional<std::string> oemPartNumber;
    std::optional<std::string> description;

    bool operator==(const CompatibilityEntry&) const = default;
};

struct SwitchBayEntry
{
    static SwitchBayEntry fromJson(const nlohmann::json& row);
    nlohmann::json::object_t toJson() const;

    std::optional<std::string> switchModel;
    std::optional<SlotId> supportedModule;

    bool operator==(const SwitchBayEntry&) const = default;
};

} // namespace xcvr_compat
