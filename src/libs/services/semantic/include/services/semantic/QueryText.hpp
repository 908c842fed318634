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

#include <cstddef>
#include <string>
#include <string_view>

#include "catalog/Interaction.hpp"
#include "catalog/Item.hpp"

namespace trippy::semantic
{
    static constexpr std::size_t maxLikedItemsInQuery{ 5 };

    // name, category, description, energy level, age suitability profile and tags, space separated
    std::string getItemText(const catalog::Item& item);

    // Built from the most recently liked candidates, falls back on a generic destination query
    std::string buildQueryText(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination);
} // namespace trippy::semantic
