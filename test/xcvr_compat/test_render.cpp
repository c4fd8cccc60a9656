#include "xcvr_compat/render.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace xcvr_compat;

static Product makeProduct(const std::string& sku, const std::string& part)
{
    Product product;
    product.skuId = sku;
    product.oemPartNumber = part;
    product.description = "10GBASE-SR SFP+";
    product.productPageUrl = "https://example.com/p/" + sku;
    return product;
}

static Matches makeMatches()
{
    Matches matches;
    matches.term = "C9300-48P";
    matches.groups.push_back(
        {SlotId("Fixed_4x10G_SFP+"), {makeProduct("SKU-A", "SFP-10G-SR")}});
    matches.groups.push_back(
        {SlotId("C9300-NM-8X"), {makeProduct("SKU-B", "SFP-10G-LR")}});
    return matches;
}

static std::string render(const QueryOutcome& outcome)
{
    std::ostringstream out;
    renderText(outcome, out);
    return out.str();
}

TEST(RenderText, NotSearchedIsSilent)
{
    EXPECT_EQ(render(NotSearched{}), "");
}

TEST(RenderText, BlankTermIsSilent)
{
    EXPECT_EQ(render(NoMatch{}), "");
}

TEST(RenderText, NoMatchNamesTerm)
{
    std::string text = render(NoMatch{"C9300-24P"});

    EXPECT_NE(text.find("No compatibility results found for C9300-24P."),
              std::string::npos);
}

TEST(RenderText, GroupHeadings)
{
    std::string text = render(makeMatches());

    auto fixed = text.find("For Fixed Uplink Ports (4x10G SFP+)");
    auto module = text.find("For Uplink Module C9300-NM-8X");
    ASSERT_NE(fixed, std::string::npos);
    ASSERT_NE(module, std::string::npos);
    EXPECT_LT(fixed, module);
    EXPECT_NE(text.find("SKU-A  SFP-10G-SR"), std::string::npos);
    EXPECT_NE(text.find("<https://example.com/p/SKU-B>"), std::string::npos);
}

TEST(RenderText, Failure)
{
    EXPECT_EQ(render(Failed{"search broke"}),
              "An Error Occurred: search broke\n");
    EXPECT_EQ(render(DataUnavailable{"no data"}),
              "An Error Occurred: no data\n");
}

TEST(RenderJson, Matches)
{
    nlohmann::json out = toJson(makeMatches());

    EXPECT_EQ(out["state"], "matches");
    EXPECT_EQ(out["term"], "C9300-48P");
    ASSERT_EQ(out["groups"].size(), 2U);
    EXPECT_EQ(out["groups"][0]["moduleOrPortId"], "Fixed_4x10G_SFP+");
    EXPECT_EQ(out["groups"][0]["kind"], "fixed");
    EXPECT_EQ(out["groups"][1]["kind"], "module");
    EXPECT_EQ(out["groups"][1]["heading"], "For Uplink Module C9300-NM-8X");
    EXPECT_EQ(out["groups"][1]["products"][0]["Your_SKU"], "SKU-B");
    EXPECT_EQ(out["groups"][1]["products"][0]["OEM_Part_Number"],
              "SFP-10G-LR");
}

TEST(RenderJson, States)
{
    EXPECT_EQ(toJson(NotSearched{})["state"], "not_searched");
    EXPECT_EQ(toJson(NoMatch{"X"})["state"], "no_match");
    EXPECT_EQ(toJson(Failed{"m"})["state"], "failed");
    EXPECT_EQ(toJson(DataUnavailable{"m"})["message"], "m");
    EXPECT_TRUE(toJson(NoMatch{"X"})["groups"].empty());
}
