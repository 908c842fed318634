/*
 * Copyright (C) 2025 The Trippy contributors
 *
 * This file is part of Trippy.
 *
 * Trippy is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Trippy is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Trippy.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "core/String.hpp"

#include <algorithm>
#include <cctype>

#include <Wt/WDateTime.h>
#include <Wt/WString.h>

namespace trippy::core::stringUtils
{
    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t separatorPos{ str.find(separator, currentPos) };
            if (separatorPos == std::string_view::npos)
                break;

            res.push_back(str.substr(currentPos, separatorPos - currentPos));
            currentPos = separatorPos + 1;
        }

        res.push_back(str.substr(currentPos));
        return res;
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        std::string res;
        bool first{ true };

        for (const std::string& str : strings)
        {
            if (!first)
                res += delimiter;
            res += str;
            first = false;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin = str.find_first_not_of(whitespaces);
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            const auto strRange{ strEnd - strBegin + 1 };

            res = str.substr(strBegin, strRange);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    void stringToLower(std::string& str)
    {
        std::transform(std::cbegin(str), std::cend(str), std::begin(str), [](unsigned char c) { return std::tolower(c); });
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(strA[i])) != std::tolower(static_cast<unsigned char>(strB[i])))
                return false;
        }

        return true;
    }

    bool stringCaseInsensitiveContains(std::string_view str, std::string_view strtoFind)
    {
        if (strtoFind.empty())
            return true; // same as std

        const auto it{ std::search(
            std::cbegin(str), std::cend(str),
            std::cbegin(strtoFind), std::cend(strtoFind),
            [](unsigned char chA, unsigned char chB) { return std::tolower(chA) == std::tolower(chB); }) };
        return (it != std::cend(str));
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromISO8601String(std::string_view dateTime)
    {
        // assume UTC
        if (!dateTime.empty() && dateTime.back() == 'Z')
            dateTime.remove_suffix(1);

        const std::vector<std::string_view> parts{ splitString(dateTime, '.') };
        if (parts.size() > 2)
            return {};

        if (parts.size() == 1)
            return Wt::WDateTime::fromString(Wt::WString{ std::string{ parts[0] } }, "yyyy-MM-ddThh:mm:ss");

        std::string milliseconds{ parts[1].substr(0, 3) };
        if (milliseconds.empty() || !std::all_of(std::cbegin(milliseconds), std::cend(milliseconds), [](unsigned char c) { return std::isdigit(c); }))
            return {};
        milliseconds.resize(3, '0');

        return Wt::WDateTime::fromString(Wt::WString{ std::string{ parts[0] } + "." + milliseconds }, "yyyy-MM-ddThh:mm:ss.zzz");
    }
} // namespace trippy::core::stringUtils
