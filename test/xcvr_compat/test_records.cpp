#include "xcvr_compat/records.hpp"
#include "xcvr_compat/slot_id.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

using namespace xcvr_compat;

static nlohmann::json::object_t getSampleProduct()
{
    nlohmann::json::object_t input;
    input["Your_SKU"] = "XC-SFP-10G-SR";
    input["OEM_Part_Number"] = "SFP-10G-SR";
    input["Description"] = "10GBASE-SR SFP+ 850nm 300m DOM LC MMF";
    input["Rate"] = "10G";
    input["Form_Factor"] = "SFP+";
    input["Reach"] = "300m";
    input["Cable_Type"] = "MMF";
    input["Media"] = "Optical";
    input["Connector_Type"] = "Duplex LC";
    input["Wavelength"] = "850nm";
    input["Case_Temp"] = "0 to 70C";
    input["Product_Page_URL"] = "https://example.com/p/xc-sfp-10g-sr";
    return input;
}

TEST(SlotId, UplinkModule)
{
    SlotId slot("C9300-NM-8X");

    EXPECT_FALSE(slot.isFixed());
    EXPECT_EQ(slot.raw(), "C9300-NM-8X");
    EXPECT_EQ(slot.label(), "C9300-NM-8X");
    EXPECT_EQ(slot.heading(), "For Uplink Module C9300-NM-8X");
}

TEST(SlotId, FixedPorts)
{
    SlotId slot("Fixed_4x10G_SFP+");

    EXPECT_TRUE(slot.isFixed());
    EXPECT_EQ(slot.raw(), "Fixed_4x10G_SFP+");
    EXPECT_EQ(slot.label(), "4x10G SFP+");
    EXPECT_EQ(slot.heading(), "For Fixed Uplink Ports (4x10G SFP+)");
    ASSERT_TRUE(std::holds_alternative<FixedPorts>(slot.value()));
}

TEST(SlotId, PrefixIsCaseSensitive)
{
    SlotId slot("fixed_ports");

    EXPECT_FALSE(slot.isFixed());
    EXPECT_EQ(slot.label(), "fixed_ports");
}

TEST(SlotId, Canonical)
{
    EXPECT_EQ(SlotId("Module_1 ").canonical(), "MODULE_1");
}

TEST(Product, ParseKeys)
{
    Product product = Product::fromJson(getSampleProduct());

    EXPECT_EQ(product.skuId, "XC-SFP-10G-SR");
    EXPECT_EQ(product.oemPartNumber, "SFP-10G-SR");
    EXPECT_EQ(product.formFactor, "SFP+");
    EXPECT_EQ(product.productPageUrl, "https://example.com/p/xc-sfp-10g-sr");
}

TEST(Product, RoundTrip)
{
    const nlohmann::json::object_t input = getSampleProduct();

    Product product = Product::fromJson(input);

    EXPECT_EQ(product.toJson(), input);
}

TEST(Product, MissingPartNumber)
{
    nlohmann::json::object_t input = getSampleProduct();
    input.erase("OEM_Part_Number");

    Product product = Product::fromJson(input);

    EXPECT_FALSE(product.oemPartNumber);
    EXPECT_EQ(product.skuId, "XC-SFP-10G-SR");
}

TEST(Product, NonStringPartNumber)
{
    nlohmann::json::object_t input = getSampleProduct();
    input["OEM_Part_Number"] = 42;
    input["Description"] = nlohmann::json::array_t();

    Product product = Product::fromJson(input);

    EXPECT_FALSE(product.oemPartNumber);
    EXPECT_EQ(product.description, "");
}

TEST(Product, BlankPartNumber)
{
    nlohmann::json::object_t input = getSampleProduct();
    input["OEM_Part_Number"] = "  ";

    EXPECT_FALSE(Product::fromJson(input).oemPartNumber);
}

TEST(Product, NotAnObject)
{
    Product product = Product::fromJson(nlohmann::json("SFP-10G-SR"));

    EXPECT_FALSE(product.skuId);
    EXPECT_FALSE(product.oemPartNumber);
    EXPECT_EQ(Product::fromJson(nlohmann::json()), Product{});
}

TEST(CompatibilityEntry, Parse)
{
    const nlohmann::json row = nlohmann::json::parse(R"(
        {
            "Device_ID": "C9300-NM-8X",
            "OEM_Part_Number": "SFP-10G-SR"
        }
    )");

    CompatibilityEntry entry = CompatibilityEntry::fromJson(row);

    EXPECT_EQ(entry.deviceId, "C9300-NM-8X");
    EXPECT_EQ(entry.oemPartNumber, "SFP-10G-SR");
    EXPECT_FALSE(entry.description);
    EXPECT_EQ(nlohmann::json(entry.toJson()), row);
}

TEST(CompatibilityEntry, NullDeviceId)
{
    const nlohmann::json row = nlohmann::json::parse(R"(
        {
            "Device_ID": null,
            "OEM_Part_Number": "SFP-10G-SR"
        }
    )");

    CompatibilityEntry entry = CompatibilityEntry::fromJson(row);

    EXPECT_FALSE(entry.deviceId);
    EXPECT_EQ(entry.oemPartNumber, "SFP-10G-SR");
}

TEST(SwitchBayEntry, Parse)
{
    const nlohmann::json row = nlohmann::json::parse(R"(
        {
            "Switch_Model": "C9300L-48P-4X",
            "Supported_Module_ID": "Fixed_4x10G_SFP+"
        }
    )");

    SwitchBayEntry entry = SwitchBayEntry::fromJson(row);

    EXPECT_EQ(entry.switchModel, "C9300L-48P-4X");
    ASSERT_TRUE(entry.supportedModule);
    EXPECT_TRUE(entry.supportedModule->isFixed());
    EXPECT_EQ(nlohmann::json(entry.toJson()), row);
}

TEST(SwitchBayEntry, NonStringModule)
{
    const nlohmann::json row = nlohmann::json::parse(R"(
        {
            "Switch_Model": "C9300-48P",
            "Supported_Module_ID": 7
        }
    )");

    SwitchBayEntry entry = SwitchBayEntry::fromJson(row);

    EXPECT_EQ(entry.switchModel, "C9300-48P");
    EXPECT_FALSE(entry.supportedModule);
}
