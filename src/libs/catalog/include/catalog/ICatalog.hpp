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

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "catalog/Interaction.hpp"
#include "catalog/Item.hpp"
#include "catalog/User.hpp"

namespace trippy::catalog
{
    // Read accessors return snapshots, safe to use while the catalog is modified
    class ICatalog
    {
    public:
        virtual ~ICatalog() = default;

        // Places located in the destination, followed by their activities
        virtual ItemContainer getCandidateItems(std::string_view destination) const = 0;

        virtual InteractionContainer getUserInteractions(std::string_view userId) const = 0;
        virtual std::optional<Item> findItem(ItemKind kind, std::string_view itemId) const = 0;
        virtual std::optional<User> findUser(std::string_view userId) const = 0;
        virtual UserContainer getAllUsers() const = 0;

        virtual void addInteraction(const Interaction& interaction) = 0;
        // Creates or replaces the user with the same id
        virtual void saveUser(const User& user) = 0;
    };

    // Missing file is created, throws catalog::Exception if the file cannot be parsed
    std::unique_ptr<ICatalog> createJsonCatalog(const std::filesystem::path& filePath);
} // namespace trippy::catalog
