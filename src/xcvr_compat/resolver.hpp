#pragma once

#include "database.hpp"
#include "records.hpp"
#include "slot_id.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace xcvr_compat
{

struct ResultGroup
{
    SlotId slot;
    std::vector<Product> products;

    const std::string& moduleOrPortId() const
    {
        return slot.raw();
    }
};

/// \brief Find the catalog products compatible with a switch model.
///
/// The switch model is matched against the switch bays to find its slots,
/// each slot against the compatibility entries to find the OEM parts it
/// accepts, and the parts against the products. All keys are compared
/// case-insensitively after trimming. Rows missing a key are skipped.
///
/// \param db the dataset to search, may be null.
/// \param rawQuery the switch model as typed by the user.
/// \return one group per slot with at least one product, in the order the
///         slots are listed for the switch. Empty for a blank query, a null
///         dataset or an unknown switch model.
std::vector<ResultGroup> resolve(const Database* db, std::string_view rawQuery);

} // namespace xcvr_compat
