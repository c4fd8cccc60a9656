// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright OpenBMC Authors

#include "utils.hpp"

#include <boost/algorithm/string/replace.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>

std::string_view trimView(std::string_view str)
{
    while (!str.empty() && isAsciiSpace(str.front()))
    {
        str.remove_prefix(1);
    }
    while (!str.empty() && isAsciiSpace(str.back()))
    {
        str.remove_suffix(1);
    }
    return str;
}

std::string toUpperCopy(std::string_view str)
{
    std::string result;
    result.reserve(str.size());
    std::ranges::transform(str, std::back_inserter(result), asciiToUpper);
    return result;
}

std::string canonicalKey(std::string_view str)
{
    return toUpperCopy(trimView(str));
}

void replaceAll(std::string& str, std::string_view search,
                std::string_view replace)
{
    boost::replace_all(str, search, replace);
}
