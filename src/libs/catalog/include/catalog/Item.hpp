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

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <Wt/Json/Object.h>

#include "catalog/Types.hpp"

namespace trippy::catalog
{
    struct ItemFeatures
    {
        std::string energyLevel; // lowercase, as found in the catalog. Empty if unset
        std::vector<std::string> tags;
        std::string ageSuitabilityProfile; // cultural, family-friendly, nightlife, educational or empty
        std::optional<std::string> priceRange;
        Wt::Json::Object extra; // unknown keys, kept as is

        // Items without energy level are considered as medium energy ones
        std::string_view getEnergyLevelOrDefault() const { return energyLevel.empty() ? toString(EnergyLevel::Medium) : std::string_view{ energyLevel }; }
    };

    struct Place
    {
        std::string location; // destination name
    };

    struct Activity
    {
        std::string placeId;
    };

    struct Item
    {
        std::string id; // unique among items of the same kind
        std::string name;
        std::string category;
        ItemFeatures features;
        std::optional<std::string> description;
        std::variant<Place, Activity> details;

        ItemKind getKind() const { return std::holds_alternative<Place>(details) ? ItemKind::Place : ItemKind::Activity; }
        ItemKey getKey() const { return ItemKey{ getKind(), id }; }

        const Place* getPlace() const { return std::get_if<Place>(&details); }
        const Activity* getActivity() const { return std::get_if<Activity>(&details); }
    };

    using ItemContainer = std::vector<Item>;
} // namespace trippy::catalog
