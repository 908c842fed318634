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

#include <algorithm>
#include <deque>
#include <set>
#include <string>
#include <string_view>

#include "catalog/ICatalog.hpp"
#include "core/String.hpp"

namespace trippy::recommendation::tests
{
    // In memory catalog, to set up scoring scenarios
    class TestCatalog final : public catalog::ICatalog
    {
    public:
        catalog::Item& addPlace(std::string_view id, std::string_view category, std::string_view location = "Paris")
        {
            catalog::Item item;
            item.id = id;
            item.name = "Place " + std::string{ id };
            item.category = category;
            item.details = catalog::Place{ std::string{ location } };

            return _items.emplace_back(std::move(item));
        }

        catalog::Item& addActivity(std::string_view id, std::string_view category, std::string_view placeId)
        {
            catalog::Item item;
            item.id = id;
            item.name = "Activity " + std::string{ id };
            item.category = category;
            item.details = catalog::Activity{ std::string{ placeId } };

            return _items.emplace_back(std::move(item));
        }

        catalog::User& addUser(std::string_view id, unsigned age)
        {
            return _users.emplace_back(catalog::User{ std::string{ id }, age, {}, {} });
        }

        void addRating(std::string_view userId, std::string_view itemId, catalog::Rating rating, catalog::ItemKind kind = catalog::ItemKind::Place)
        {
            _interactions.push_back(catalog::Interaction{ std::string{ userId }, std::string{ itemId }, kind, rating, {} });
        }

    private:
        catalog::ItemContainer getCandidateItems(std::string_view destination) const override
        {
            catalog::ItemContainer res;
            std::set<std::string, std::less<>> placeIds;

            for (const catalog::Item& item : _items)
            {
                const catalog::Place* place{ item.getPlace() };
                if (place && core::stringUtils::stringCaseInsensitiveEqual(place->location, destination))
                {
                    res.push_back(item);
                    placeIds.insert(item.id);
                }
            }

            for (const catalog::Item& item : _items)
            {
                const catalog::Activity* activity{ item.getActivity() };
                if (activity && placeIds.contains(activity->placeId))
                    res.push_back(item);
            }

            return res;
        }

        catalog::InteractionContainer getUserInteractions(std::string_view userId) const override
        {
            catalog::InteractionContainer res;
            std::copy_if(std::cbegin(_interactions), std::cend(_interactions), std::back_inserter(res), [&](const catalog::Interaction& interaction) { return interaction.userId == userId; });

            return res;
        }

        std::optional<catalog::Item> findItem(catalog::ItemKind kind, std::string_view itemId) const override
        {
            for (const catalog::Item& item : _items)
            {
                if (item.getKind() == kind && item.id == itemId)
                    return item;
            }

            return std::nullopt;
        }

        std::optional<catalog::User> findUser(std::string_view userId) const override
        {
            for (const catalog::User& user : _users)
            {
                if (user.id == userId)
                    return user;
            }

            return std::nullopt;
        }

        catalog::UserContainer getAllUsers() const override { return { std::cbegin(_users), std::cend(_users) }; }

        void addInteraction(const catalog::Interaction& interaction) override { _interactions.push_back(interaction); }

        void saveUser(const catalog::User& user) override
        {
            auto it{ std::find_if(std::begin(_users), std::end(_users), [&](const catalog::User& existingUser) { return existingUser.id == user.id; }) };
            if (it != std::end(_users))
                *it = user;
            else
                _users.push_back(user);
        }

        // deque to keep references valid while setting up
        std::deque<catalog::Item> _items;
        std::deque<catalog::User> _users;
        catalog::InteractionContainer _interactions;
    };
} // namespace trippy::recommendation::tests
