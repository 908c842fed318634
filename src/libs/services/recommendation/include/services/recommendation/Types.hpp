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
#include <vector>

#include "catalog/Item.hpp"

namespace trippy::recommendation
{
    struct Recommendation
    {
        catalog::Item item;
        double score{};
    };

    // Sorted by descending score
    using RecommendationContainer = std::vector<Recommendation>;

    struct Settings
    {
        std::size_t neighborCount{ 10 }; // similar users considered by the collaborative scorer
    };
} // namespace trippy::recommendation
