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
#include <shared_mutex>

#include "catalog/ICatalog.hpp"

#include "JsonSerializer.hpp"

namespace trippy::catalog
{
    class JsonCatalog final : public ICatalog
    {
    public:
        JsonCatalog(const std::filesystem::path& filePath);
        ~JsonCatalog() override = default;
        JsonCatalog(const JsonCatalog&) = delete;
        JsonCatalog& operator=(const JsonCatalog&) = delete;

    private:
        ItemContainer getCandidateItems(std::string_view destination) const override;
        InteractionContainer getUserInteractions(std::string_view userId) const override;
        std::optional<Item> findItem(ItemKind kind, std::string_view itemId) const override;
        std::optional<User> findUser(std::string_view userId) const override;
        UserContainer getAllUsers() const override;

        void addInteraction(const Interaction& interaction) override;
        void saveUser(const User& user) override;

        void load();
        // Writes in a temporary file first, then replaces the catalog file
        void save(const json::CatalogData& data) const;

        const std::filesystem::path _filePath;

        mutable std::shared_mutex _mutex;
        json::CatalogData _data;
    };
} // namespace trippy::catalog
