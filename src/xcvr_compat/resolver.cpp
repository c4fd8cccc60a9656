#include "resolver.hpp"

#include "../utils.hpp"

#include <boost/container/flat_set.hpp>
#include <phosphor-logging/lg2.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xcvr_compat
{

using PartSet = boost::container::flat_set<std::string>;

static std::vector<SlotId> findSlots(const Database& db,
                                     const std::string& model)
{
    std::vector<SlotId> slots;
    for (const auto& bay : db.switchBays)
    {
        if (!bay.switchModel || canonicalKey(*bay.switchModel) != model)
        {
            continue;
        }
        if (!bay.supportedModule)
        {
            lg2::debug("Switch bay for {MODEL} has no module id", "MODEL",
                       *bay.switchModel);
            continue;
        }
        slots.push_back(*bay.supportedModule);
    }
    return slots;
}

static PartSet findCompatibleParts(const Database& db, const SlotId& slot)
{
    const std::string slotKey = slot.canonical();

    PartSet parts;
    for (const auto& entry : db.compatibility)
    {
        if (!entry.deviceId || !entry.oemPartNumber)
        {
            continue;
        }
        if (canonicalKey(*entry.deviceId) == slotKey)
        {
            parts.insert(canonicalKey(*entry.oemPartNumber));
        }
    }
    return parts;
}

static std::vector<Product> findProducts(const Database& db,
                                         const PartSet& parts)
{
    std::vector<Product> found;
    if (parts.empty())
    {
        return found;
    }

    for (const auto& product : db.products)
    {
        if (product.oemPartNumber &&
            parts.find(canonicalKey(*product.oemPartNumber)) != parts.end())
        {
            found.push_back(product);
        }
    }
    return found;
}

std::vector<ResultGroup> resolve(const Database* db, std::string_view rawQuery)
{
    std::vector<ResultGroup> groups;

    const std::string model = canonicalKey(rawQuery);
    if (db == nullptr || model.empty())
    {
        return groups;
    }

    // the same slot may be listed twice for a model, each listing gets a group
    for (const SlotId& slot : findSlots(*db, model))
    {
        std::vector<Product> products =
            findProducts(*db, findCompatibleParts(*db, slot));
        if (products.empty())
        {
            continue;
        }
        groups.emplace_back(slot, std::move(products));
    }

    lg2::debug("{MODEL} resolved to {NGROUPS} slot group(s)", "MODEL", model,
               "NGROUPS", groups.size());

    return groups;
}

} // namespace xcvr_compat
