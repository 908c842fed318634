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

#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>

#include "core/Exception.hpp"

namespace trippy::catalog
{
    class Exception : public core::TrippyException
    {
    public:
        using TrippyException::TrippyException;
    };

    enum class ItemKind
    {
        Place,
        Activity,
    };

    // Item ids are only unique among items of the same kind
    struct ItemKey
    {
        ItemKind kind{ ItemKind::Place };
        std::string id;

        auto operator<=>(const ItemKey&) const = default;
    };

    enum class EnergyLevel
    {
        Low,
        Medium,
        High,
    };

    // Caution: values are used in score computations
    enum class Rating : int
    {
        Dislike = -1,
        Like = 1,
    };

    constexpr int getRatingValue(Rating rating)
    {
        return static_cast<int>(rating);
    }

    // Lowercase names, as stored in the catalog file
    std::string_view toString(ItemKind kind);
    std::string_view toString(EnergyLevel energyLevel);

    // Case insensitive
    std::optional<ItemKind> parseItemKind(std::string_view str);
    std::optional<EnergyLevel> parseEnergyLevel(std::string_view str);
} // namespace trippy::catalog
