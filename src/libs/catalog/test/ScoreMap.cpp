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

#include "catalog/ScoreMap.hpp"

namespace trippy::catalog::tests
{
    namespace
    {
        ItemKey place(std::string_view id)
        {
            return ItemKey{ ItemKind::Place, std::string{ id } };
        }

        std::vector<std::string> getItemIds(const ScoreMap& scores)
        {
            std::vector<std::string> res;
            for (const ScoreMap::Entry& entry : scores)
                res.push_back(entry.itemKey.id);

            return res;
        }
    } // namespace

    TEST(ScoreMap, empty)
    {
        const ScoreMap scores;
        EXPECT_TRUE(scores.empty());
        EXPECT_EQ(scores.size(), 0);
        EXPECT_FALSE(scores.contains(place("p1")));
        EXPECT_EQ(scores.find(place("p1")), std::nullopt);
        EXPECT_EQ(scores.getScore(place("p1")), 0.);
        EXPECT_EQ(scores.getMaxScore(), std::nullopt);
    }

    TEST(ScoreMap, accumulate)
    {
        ScoreMap scores;
        scores.add(place("p1"), 0.5);
        scores.add(place("p2"), 0.25);
        scores.add(place("p1"), 0.5);

        ASSERT_EQ(scores.size(), 2);
        EXPECT_DOUBLE_EQ(scores.getScore(place("p1")), 1.);
        EXPECT_DOUBLE_EQ(scores.getScore(place("p2")), 0.25);
        EXPECT_EQ(getItemIds(scores), (std::vector<std::string>{ "p1", "p2" }));

        scores.set(place("p1"), 0.1);
        EXPECT_DOUBLE_EQ(scores.getScore(place("p1")), 0.1);
        EXPECT_DOUBLE_EQ(*scores.getMaxScore(), 0.25);
    }

    TEST(ScoreMap, kindsAreDistinct)
    {
        const ItemKey activity{ ItemKind::Activity, "p1" };

        ScoreMap scores;
        scores.add(place("p1"), 0.5);
        scores.add(activity, 0.25);

        ASSERT_EQ(scores.size(), 2);
        EXPECT_DOUBLE_EQ(scores.getScore(place("p1")), 0.5);
        EXPECT_DOUBLE_EQ(scores.getScore(activity), 0.25);

        scores.eraseIf([](const ScoreMap::Entry& entry) { return entry.itemKey.kind == ItemKind::Place; });
        EXPECT_FALSE(scores.contains(place("p1")));
        EXPECT_TRUE(scores.contains(activity));
    }

    TEST(ScoreMap, stableSort)
    {
        ScoreMap scores;
        scores.set(place("a"), 0.2);
        scores.set(place("b"), 0.5);
        scores.set(place("c"), 0.2);
        scores.set(place("d"), 0.5);
        scores.set(place("e"), 0.9);

        scores.sortByDescendingScore();
        EXPECT_EQ(getItemIds(scores), (std::vector<std::string>{ "e", "b", "d", "a", "c" }));

        // indexes must follow the entries
        EXPECT_DOUBLE_EQ(scores.getScore(place("a")), 0.2);
        EXPECT_DOUBLE_EQ(scores.getScore(place("e")), 0.9);

        scores.truncate(2);
        EXPECT_EQ(getItemIds(scores), (std::vector<std::string>{ "e", "b" }));
        EXPECT_FALSE(scores.contains(place("d")));

        scores.truncate(10);
        EXPECT_EQ(scores.size(), 2);
    }

    TEST(ScoreMap, eraseAndTransform)
    {
        ScoreMap scores;
        scores.set(place("a"), 1.);
        scores.set(place("b"), 2.);
        scores.set(place("c"), 4.);

        scores.eraseIf([](const ScoreMap::Entry& entry) { return entry.itemKey.id == "b"; });
        EXPECT_EQ(getItemIds(scores), (std::vector<std::string>{ "a", "c" }));
        EXPECT_DOUBLE_EQ(scores.getScore(place("c")), 4.);

        scores.transformScores([](double score) { return score / 4.; });
        EXPECT_DOUBLE_EQ(scores.getScore(place("a")), 0.25);
        EXPECT_DOUBLE_EQ(scores.getScore(place("c")), 1.);
    }
} // namespace trippy::catalog::tests
