// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright OpenBMC Authors

#pragma once

#include <string>
#include <string_view>

inline char asciiToUpper(char c)
{
    // Converts a character to upper case without relying on std::locale
    if ('a' <= c && c <= 'z')
    {
        c += static_cast<char>('A' - 'a');
    }
    return c;
}

inline bool isAsciiSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

std::string_view trimView(std::string_view str);

std::string toUpperCopy(std::string_view str);

/// \brief Build the form used for every key comparison in the dataset.
/// \param str the raw key as it appears in the dataset or in a query.
/// \return str with surrounding whitespace removed and ASCII letters
///         upper-cased.
std::string canonicalKey(std::string_view str);

void replaceAll(std::string& str, std::string_view search,
                std::string_view replace);
