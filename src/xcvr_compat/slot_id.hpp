#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace xcvr_compat
{

constexpr std::string_view fixedPortsPrefix = "Fixed_";

// A group of fixed ports on the switch chassis, e.g. "Fixed_4x10G_SFP+".
struct FixedPorts
{
    std::string id;
    std::string label;
};

// A bay accepting a pluggable uplink module, e.g. "C9300-NM-8X".
struct UplinkModule
{
    std::string id;
};

class SlotId
{
  public:
    explicit SlotId(std::string_view raw);

    const std::string& raw() const;
    std::string canonical() const;

    bool isFixed() const
    {
        return std::holds_alternative<FixedPorts>(slot);
    }

    // Human readable name: the port label for fixed ports, the module id
    // otherwise.
    const std::string& label() const;

    std::string heading() const;

    const std::variant<FixedPorts, UplinkModule>& value() const
    {
        return slot;
    }

    bool operator==(const SlotId& other) const
    {
        return raw() == other.raw();
    }

  private:
    std::variant<FixedPorts, UplinkModule> slot;
};

} // namespace xcvr_compat
