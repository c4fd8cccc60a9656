#include "render.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace xcvr_compat
{

static std::string valueOr(const std::optional<std::string>& value)
{
    return value.value_or("-");
}

static void renderGroup(const ResultGroup& group, std::ostream& out)
{
    out << group.slot.heading() << "\n";
    out << std::string(group.slot.heading().size(), '-') << "\n";
    for (const auto& product : group.products)
    {
        out << "  " << valueOr(product.skuId) << "  "
            << valueOr(product.oemPartNumber) << "  " << product.description;
        if (!product.productPageUrl.empty())
        {
            out << "  <" << product.productPageUrl << ">";
        }
        out << "\n";
    }
}

static nlohmann::json::object_t groupToJson(const ResultGroup& group)
{
    nlohmann::json::object_t res;
    res["moduleOrPortId"] = group.moduleOrPortId();
    res["kind"] = group.slot.isFixed() ? "fixed" : "module";
    res["heading"] = group.slot.heading();
    res["products"] = nlohmann::json::array_t();
    for (const auto& product : group.products)
    {
        res["products"].push_back(product.toJson());
    }
    return res;
}

struct OutcomeToTextVisitor
{
    std::ostream& out;

    void operator()(const NotSearched&) const {}

    void operator()(const NoMatch& noMatch) const
    {
        if (noMatch.term.empty())
        {
            return;
        }
        out << "No compatibility results found for " << noMatch.term << ".\n"
            << "Please check the model number or contact our experts for assistance.\n";
    }

    void operator()(const Matches& matches) const
    {
        for (const auto& group : matches.groups)
        {
            renderGroup(group, out);
            out << "\n";
        }
    }

    void operator()(const Failed& failed) const
    {
        out << "An Error Occurred: " << failed.message << "\n";
    }

    void operator()(const DataUnavailable& unavailable) const
    {
        out << "An Error Occurred: " << unavailable.message << "\n";
    }
};

struct OutcomeToJsonVisitor
{
    nlohmann::json::object_t& res;

    void operator()(const NotSearched&) const
    {
        res["state"] = "not_searched";
    }

    void operator()(const NoMatch& noMatch) const
    {
        res["state"] = "no_match";
        res["term"] = noMatch.term;
    }

    void operator()(const Matches& matches) const
    {
        res["state"] = "matches";
        res["term"] = matches.term;
        for (const auto& group : matches.groups)
        {
            res["groups"].push_back(groupToJson(group));
        }
    }

    void operator()(const Failed& failed) const
    {
        res["state"] = "failed";
        res["message"] = failed.message;
    }

    void operator()(const DataUnavailable& unavailable) const
    {
        res["state"] = "data_unavailable";
        res["message"] = unavailable.message;
    }
};

void renderText(const QueryOutcome& outcome, std::ostream& out)
{
    std::visit(OutcomeToTextVisitor{out}, outcome);
}

nlohmann::json toJson(const QueryOutcome& outcome)
{
    nlohmann::json::object_t res;
    res["groups"] = nlohmann::json::array_t();

    std::visit(OutcomeToJsonVisitor{res}, outcome);

    return res;
}

} // namespace xcvr_compat
