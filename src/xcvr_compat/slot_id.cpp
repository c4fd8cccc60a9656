#include "slot_id.hpp"

#include "../utils.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace xcvr_compat
{

static std::variant<FixedPorts, UplinkModule> classify(std::string_view raw)
{
    if (!raw.starts_with(fixedPortsPrefix))
    {
        return UplinkModule{std::string(raw)};
    }

    std::string label(raw.substr(fixedPortsPrefix.size()));
    replaceAll(label, "_", " ");
    return FixedPorts{std::string(raw), label};
}

SlotId::SlotId(std::string_view raw) : slot(classify(raw)) {}

const std::string& SlotId::raw() const
{
    return std::visit([](const auto& s) -> const std::string& { return s.id; },
                      slot);
}

std::string SlotId::canonical() const
{
    return canonicalKey(raw());
}

const std::string& SlotId::label() const
{
    if (const auto* fixed = std::get_if<FixedPorts>(&slot))
    {
        return fixed->label;
    }
    return std::get<UplinkModule>(slot).id;
}

std::string SlotId::heading() const
{
    if (isFixed())
    {
        return "For Fixed Uplink Ports (" + label() + ")";
    }
    return "For Uplink Module " + label();
}

} // namespace xcvr_compat
