// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace chatvox
{

[[nodiscard]] inline auto toLower(std::string_view str) -> std::string
{
    auto result = std::string {};
    result.reserve(str.size());
    for (auto ch: str)
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

[[nodiscard]] inline auto equalsIgnoreCase(std::string_view a, std::string_view b) -> bool
{
    if (a.size() != b.size())
        return false;
    for (auto i = std::size_t { 0 }; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

/// @brief Strips leading and trailing whitespace.
[[nodiscard]] inline auto trim(std::string_view str) -> std::string_view
{
    auto const isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    while (!str.empty() && isSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && isSpace(str.back()))
        str.remove_suffix(1);
    return str;
}

} // namespace chatvox
