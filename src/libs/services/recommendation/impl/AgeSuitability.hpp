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

#include "catalog/Item.hpp"

namespace trippy::recommendation
{
    static constexpr double minAgeMultiplier{ 0.5 };
    static constexpr double maxAgeMultiplier{ 1.5 };

    // In [minAgeMultiplier, maxAgeMultiplier], 1.0 for items with no age related trait
    double computeAgeMultiplier(unsigned age, const catalog::Item& item);
} // namespace trippy::recommendation
