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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WTime.h>

#include "services/semantic/QueryText.hpp"

namespace trippy::semantic::tests
{
    namespace
    {
        catalog::Item createPlace(std::string_view id, std::string_view name)
        {
            catalog::Item item;
            item.id = id;
            item.name = name;
            item.details = catalog::Place{ "Paris" };

            return item;
        }

        catalog::Interaction createInteraction(std::string_view itemId, catalog::Rating rating, Wt::WDateTime timestamp = {})
        {
            return catalog::Interaction{ "u1", std::string{ itemId }, catalog::ItemKind::Place, rating, timestamp };
        }

        Wt::WDateTime createTimestamp(int day)
        {
            return Wt::WDateTime{ Wt::WDate{ 2024, 1, day }, Wt::WTime{ 10, 0 } };
        }
    } // namespace

    TEST(QueryText, itemText)
    {
        catalog::Item item{ createPlace("p1", "Louvre") };
        item.category = "museum";
        item.description = "Famous museum";
        item.features.energyLevel = "low";
        item.features.ageSuitabilityProfile = "cultural";
        item.features.tags = { "art", "history" };

        EXPECT_EQ(getItemText(item), "Louvre museum Famous museum low cultural art history");
    }

    TEST(QueryText, itemTextSkipsEmptyParts)
    {
        catalog::Item item{ createPlace("p1", "Louvre") };
        item.features.tags = { "art" };

        EXPECT_EQ(getItemText(item), "Louvre art");
    }

    TEST(QueryText, noLikedItems)
    {
        const catalog::ItemContainer candidates{ createPlace("p1", "Louvre") };

        EXPECT_EQ(buildQueryText({}, candidates, "Paris"), "places and activities in Paris");
        EXPECT_EQ(buildQueryText({ createInteraction("p1", catalog::Rating::Dislike) }, candidates, "Paris"), "places and activities in Paris");
    }

    TEST(QueryText, likedItemsNotInCandidates)
    {
        const catalog::ItemContainer candidates{ createPlace("p1", "Louvre") };

        EXPECT_EQ(buildQueryText({ createInteraction("p2", catalog::Rating::Like) }, candidates, "Paris"), "places in Paris");
    }

    TEST(QueryText, mostRecentLikedItems)
    {
        catalog::ItemContainer candidates;
        catalog::InteractionContainer interactions;
        for (int i{ 1 }; i <= 7; ++i)
        {
            const std::string id{ "p" + std::to_string(i) };
            candidates.push_back(createPlace(id, "n" + std::to_string(i)));
            interactions.push_back(createInteraction(id, catalog::Rating::Like, createTimestamp(i)));
        }
        interactions[6].rating = catalog::Rating::Dislike;

        EXPECT_EQ(buildQueryText(interactions, candidates, "Paris"), "n6 n5 n4 n3 n2");
    }

    TEST(QueryText, invalidTimestampsLast)
    {
        const catalog::ItemContainer candidates{ createPlace("p1", "n1"), createPlace("p2", "n2"), createPlace("p3", "n3") };
        const catalog::InteractionContainer interactions{
            createInteraction("p1", catalog::Rating::Like),
            createInteraction("p2", catalog::Rating::Like, createTimestamp(1)),
            createInteraction("p3", catalog::Rating::Like, createTimestamp(1)),
        };

        // same timestamps keep the interaction order
        EXPECT_EQ(buildQueryText(interactions, candidates, "Paris"), "n2 n3 n1");
    }

    TEST(QueryText, kindMustMatch)
    {
        catalog::Item activity{ createPlace("p1", "Cooking class") };
        activity.details = catalog::Activity{ "p0" };

        EXPECT_EQ(buildQueryText({ createInteraction("p1", catalog::Rating::Like) }, { activity }, "Paris"), "places in Paris");
    }
} // namespace trippy::semantic::tests
