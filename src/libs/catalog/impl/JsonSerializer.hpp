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
#include <string_view>

#include "catalog/Interaction.hpp"
#include "catalog/Item.hpp"
#include "catalog/User.hpp"

namespace trippy::catalog::json
{
    struct CatalogData
    {
        UserContainer users;
        ItemContainer places;
        ItemContainer activities;
        InteractionContainer interactions;
    };

    // Invalid entries are skipped, throws Exception if the document itself cannot be parsed
    CatalogData parseCatalog(std::string_view document);
    std::string serializeCatalog(const CatalogData& data);
} // namespace trippy::catalog::json
