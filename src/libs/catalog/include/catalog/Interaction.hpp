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

#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "catalog/Types.hpp"

namespace trippy::catalog
{
    struct Interaction
    {
        std::string userId;
        std::string itemId;
        ItemKind itemType{ ItemKind::Place };
        Rating rating{ Rating::Like };
        Wt::WDateTime timestamp;

        bool isPositive() const { return getRatingValue(rating) > 0; }
        ItemKey getItemKey() const { return ItemKey{ itemType, itemId }; }
    };

    // Several interactions may exist for the same user/item pair
    using InteractionContainer = std::vector<Interaction>;
} // namespace trippy::catalog
