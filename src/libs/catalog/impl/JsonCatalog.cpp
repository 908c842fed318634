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

#include "JsonCatalog.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace trippy::catalog
{
    std::unique_ptr<ICatalog> createJsonCatalog(const std::filesystem::path& filePath)
    {
        return std::make_unique<JsonCatalog>(filePath);
    }

    JsonCatalog::JsonCatalog(const std::filesystem::path& filePath)
        : _filePath{ filePath }
    {
        load();
    }

    ItemContainer JsonCatalog::getCandidateItems(std::string_view destination) const
    {
        ItemContainer res;
        std::unordered_set<std::string> placeIds;

        std::shared_lock lock{ _mutex };

        for (const Item& place : _data.places)
        {
            if (!core::stringUtils::stringCaseInsensitiveEqual(place.getPlace()->location, destination))
                continue;

            placeIds.insert(place.id);
            res.push_back(place);
        }

        for (const Item& activity : _data.activities)
        {
            if (placeIds.contains(activity.getActivity()->placeId))
                res.push_back(activity);
        }

        TRIPPY_LOG(CATALOG, DEBUG, "Found " << placeIds.size() << " places and " << (res.size() - placeIds.size()) << " activities in '" << destination << "'");

        return res;
    }

    InteractionContainer JsonCatalog::getUserInteractions(std::string_view userId) const
    {
        InteractionContainer res;

        std::shared_lock lock{ _mutex };
        std::copy_if(std::cbegin(_data.interactions), std::cend(_data.interactions), std::back_inserter(res), [&](const Interaction& interaction) { return interaction.userId == userId; });

        return res;
    }

    std::optional<Item> JsonCatalog::findItem(ItemKind kind, std::string_view itemId) const
    {
        std::shared_lock lock{ _mutex };

        const ItemContainer& items{ kind == ItemKind::Place ? _data.places : _data.activities };
        const auto it{ std::find_if(std::cbegin(items), std::cend(items), [&](const Item& item) { return item.id == itemId; }) };
        if (it == std::cend(items))
            return std::nullopt;

        return *it;
    }

    std::optional<User> JsonCatalog::findUser(std::string_view userId) const
    {
        std::shared_lock lock{ _mutex };

        const auto it{ std::find_if(std::cbegin(_data.users), std::cend(_data.users), [&](const User& user) { return user.id == userId; }) };
        if (it == std::cend(_data.users))
            return std::nullopt;

        return *it;
    }

    UserContainer JsonCatalog::getAllUsers() const
    {
        std::shared_lock lock{ _mutex };
        return _data.users;
    }

    void JsonCatalog::addInteraction(const Interaction& interaction)
    {
        std::unique_lock lock{ _mutex };

        // in-memory data only changes once the file is written
        json::CatalogData data{ _data };
        data.interactions.push_back(interaction);
        save(data);

        _data = std::move(data);
    }

    void JsonCatalog::saveUser(const User& user)
    {
        std::unique_lock lock{ _mutex };

        json::CatalogData data{ _data };
        auto it{ std::find_if(std::begin(data.users), std::end(data.users), [&](const User& existingUser) { return existingUser.id == user.id; }) };
        if (it != std::end(data.users))
            *it = user;
        else
            data.users.push_back(user);

        save(data);

        _data = std::move(data);
    }

    void JsonCatalog::load()
    {
        if (!std::filesystem::exists(_filePath))
        {
            TRIPPY_LOG(CATALOG, INFO, "Catalog file '" << _filePath.string() << "' does not exist, creating an empty one");

            std::error_code ec;
            if (_filePath.has_parent_path())
                std::filesystem::create_directories(_filePath.parent_path(), ec);
            if (ec)
                throw Exception{ "Cannot create directory '" + _filePath.parent_path().string() + "': " + ec.message() };

            save(_data);
            return;
        }

        std::ifstream ifs{ _filePath };
        if (!ifs)
            throw Exception{ "Cannot open catalog file '" + _filePath.string() + "'" };

        std::ostringstream oss;
        oss << ifs.rdbuf();

        _data = json::parseCatalog(oss.str());

        TRIPPY_LOG(CATALOG, INFO, "Loaded catalog '" << _filePath.string() << "': " << _data.users.size() << " users, " << _data.places.size() << " places, "
                                                      << _data.activities.size() << " activities, " << _data.interactions.size() << " interactions");
    }

    void JsonCatalog::save(const json::CatalogData& data) const
    {
        std::filesystem::path tmpFilePath{ _filePath };
        tmpFilePath += ".tmp";

        {
            std::ofstream ofs{ tmpFilePath, std::ios::out | std::ios::trunc };
            if (!ofs)
                throw Exception{ "Cannot open '" + tmpFilePath.string() + "' for writing" };

            ofs << json::serializeCatalog(data);
            if (!ofs)
                throw Exception{ "Cannot write in file '" + tmpFilePath.string() + "', no space left?" };
        }

        std::error_code ec;
        std::filesystem::rename(tmpFilePath, _filePath, ec);
        if (ec)
            throw Exception{ "Cannot rename '" + tmpFilePath.string() + "' to '" + _filePath.string() + "': " + ec.message() };

        TRIPPY_LOG(CATALOG, DEBUG, "Catalog saved in '" << _filePath.string() << "'");
    }
} // namespace trippy::catalog
