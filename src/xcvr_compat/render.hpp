#pragma once

#include "query.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace xcvr_compat
{

void renderText(const QueryOutcome& outcome, std::ostream& out);

nlohmann::json toJson(const QueryOutcome& outcome);

} // namespace xcvr_compat
