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

#include "services/semantic/QueryText.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include "core/String.hpp"

namespace trippy::semantic
{
    namespace
    {
        const catalog::Item* findCandidate(const catalog::ItemContainer& candidates, catalog::ItemKind kind, std::string_view itemId)
        {
            const auto it{ std::find_if(std::cbegin(candidates), std::cend(candidates), [&](const catalog::Item& item) { return item.getKind() == kind && item.id == itemId; }) };
            return it != std::cend(candidates) ? &(*it) : nullptr;
        }

        // Most recent first, interactions without valid timestamp last
        bool isMoreRecent(const catalog::Interaction& lhs, const catalog::Interaction& rhs)
        {
            if (!lhs.timestamp.isValid())
                return false;
            if (!rhs.timestamp.isValid())
                return true;

            return lhs.timestamp > rhs.timestamp;
        }
    } // namespace

    std::string getItemText(const catalog::Item& item)
    {
        std::vector<std::string> parts;

        auto addPart{ [&](std::string_view part) {
            if (!part.empty())
                parts.emplace_back(part);
        } };

        addPart(item.name);
        addPart(item.category);
        addPart(item.description.value_or(""));
        addPart(item.features.energyLevel);
        addPart(item.features.ageSuitabilityProfile);
        addPart(core::stringUtils::joinStrings(item.features.tags, " "));

        return core::stringUtils::joinStrings(parts, " ");
    }

    std::string buildQueryText(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination)
    {
        catalog::InteractionContainer likedInteractions;
        std::copy_if(std::cbegin(userInteractions), std::cend(userInteractions), std::back_inserter(likedInteractions), [](const catalog::Interaction& interaction) { return interaction.isPositive(); });

        if (likedInteractions.empty())
            return "places and activities in " + std::string{ destination };

        std::stable_sort(std::begin(likedInteractions), std::end(likedInteractions), isMoreRecent);
        if (likedInteractions.size() > maxLikedItemsInQuery)
            likedInteractions.resize(maxLikedItemsInQuery);

        std::vector<std::string> queryParts;
        for (const catalog::Interaction& interaction : likedInteractions)
        {
            if (const catalog::Item * item{ findCandidate(candidates, interaction.itemType, interaction.itemId) })
                queryParts.push_back(getItemText(*item));
        }

        if (queryParts.empty())
            return "places in " + std::string{ destination };

        return core::stringUtils::joinStrings(queryParts, " ");
    }
} // namespace trippy::semantic
