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

#include "catalog/Types.hpp"

#include "core/String.hpp"

namespace trippy::catalog
{
    std::string_view toString(ItemKind kind)
    {
        switch (kind)
        {
        case ItemKind::Place:
            return "place";
        case ItemKind::Activity:
            return "activity";
        }
        return "";
    }

    std::string_view toString(EnergyLevel energyLevel)
    {
        switch (energyLevel)
        {
        case EnergyLevel::Low:
            return "low";
        case EnergyLevel::Medium:
            return "medium";
        case EnergyLevel::High:
            return "high";
        }
        return "";
    }

    std::optional<ItemKind> parseItemKind(std::string_view str)
    {
        for (const ItemKind kind : { ItemKind::Place, ItemKind::Activity })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(kind)))
                return kind;
        }

        return std::nullopt;
    }

    std::optional<EnergyLevel> parseEnergyLevel(std::string_view str)
    {
        for (const EnergyLevel energyLevel : { EnergyLevel::Low, EnergyLevel::Medium, EnergyLevel::High })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(energyLevel)))
                return energyLevel;
        }

        return std::nullopt;
    }
} // namespace trippy::catalog
