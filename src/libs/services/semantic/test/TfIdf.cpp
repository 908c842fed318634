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

#include "services/semantic/ISemanticService.hpp"
#include "tfidf/TfIdfIndex.hpp"

namespace trippy::semantic::tests
{
    namespace
    {
        catalog::Item createItem(catalog::ItemKind kind, std::string_view id, std::string_view name, std::string_view category, std::optional<std::string> description = std::nullopt)
        {
            catalog::Item item;
            item.id = id;
            item.name = name;
            item.category = category;
            item.description = std::move(description);
            if (kind == catalog::ItemKind::Place)
                item.details = catalog::Place{ "Paris" };
            else
                item.details = catalog::Activity{ "p1" };

            return item;
        }

        catalog::Interaction createInteraction(catalog::ItemKind kind, std::string_view itemId, catalog::Rating rating)
        {
            return catalog::Interaction{ "u1", std::string{ itemId }, kind, rating, {} };
        }

        std::vector<std::string> getItemIds(const catalog::ScoreMap& scores)
        {
            std::vector<std::string> res;
            for (const catalog::ScoreMap::Entry& entry : scores)
                res.push_back(entry.itemKey.id);

            return res;
        }

        const catalog::ItemContainer candidates{
            createItem(catalog::ItemKind::Place, "p1", "Louvre", "museum", "Art, history"),
            createItem(catalog::ItemKind::Place, "p2", "Moulin", "club", "Best club in Paris"),
            createItem(catalog::ItemKind::Place, "p3", "Orsay", "museum", "Impressionist art"),
            createItem(catalog::ItemKind::Activity, "a1", "Sketching", "workshop", "Drawing art lessons"),
        };
    } // namespace

    TEST(TfIdf, tokenize)
    {
        EXPECT_EQ(tokenize(""), std::vector<std::string>{});
        EXPECT_EQ(tokenize("  Hello, World!  "), (std::vector<std::string>{ "hello", "world" }));
        EXPECT_EQ(tokenize("family-friendly 24h"), (std::vector<std::string>{ "family", "friendly", "24h" }));
        EXPECT_EQ(tokenize("Café crème"), (std::vector<std::string>{ "café", "crème" }));
    }

    TEST(TfIdf, indexSearch)
    {
        TfIdfIndex index;
        index.upsert("d1", "art history");
        index.upsert("d2", "beach sun sand");
        index.upsert("d3", "art gallery");
        EXPECT_EQ(index.getDocumentCount(), 3);

        {
            const std::vector<TfIdfIndex::Hit> hits{ index.search("ART") };
            ASSERT_EQ(hits.size(), 2);
            EXPECT_EQ(hits[0].key, "d1");
            EXPECT_EQ(hits[1].key, "d3");
            EXPECT_DOUBLE_EQ(hits[0].score, hits[1].score);
        }

        {
            const std::vector<TfIdfIndex::Hit> hits{ index.search("beach sun sand") };
            ASSERT_EQ(hits.size(), 1);
            EXPECT_EQ(hits[0].key, "d2");
            EXPECT_NEAR(hits[0].score, 1., 1e-9);
        }

        EXPECT_TRUE(index.search("unknown words").empty());
        EXPECT_TRUE(index.search("").empty());
    }

    TEST(TfIdf, indexSearchRanking)
    {
        TfIdfIndex index;
        index.upsert("d1", "art");
        index.upsert("d2", "art museum gallery");
        index.upsert("d3", "beach");

        const std::vector<TfIdfIndex::Hit> hits{ index.search("art") };
        ASSERT_EQ(hits.size(), 2);
        EXPECT_EQ(hits[0].key, "d1");
        EXPECT_EQ(hits[1].key, "d2");
        EXPECT_GT(hits[0].score, hits[1].score);
        for (const TfIdfIndex::Hit& hit : hits)
        {
            EXPECT_GT(hit.score, 0.);
            EXPECT_LE(hit.score, 1.);
        }
    }

    TEST(TfIdf, indexUpsertReplaces)
    {
        TfIdfIndex index;
        index.upsert("d1", "beach");
        index.upsert("d1", "museum");

        EXPECT_EQ(index.getDocumentCount(), 1);
        EXPECT_TRUE(index.contains("d1"));
        EXPECT_TRUE(index.search("beach").empty());

        const std::vector<TfIdfIndex::Hit> hits{ index.search("museum") };
        ASSERT_EQ(hits.size(), 1);
        EXPECT_EQ(hits[0].key, "d1");
    }

    TEST(TfIdf, serviceQuery)
    {
        auto service{ createTfIdfSemanticService() };
        service->upsert(candidates);

        const catalog::InteractionContainer interactions{ createInteraction(catalog::ItemKind::Place, "p1", catalog::Rating::Like) };
        const catalog::ScoreMap scores{ service->query(interactions, candidates, "Paris", 10) };

        EXPECT_FALSE(scores.contains(catalog::ItemKey{ catalog::ItemKind::Place, "p1" }));
        EXPECT_TRUE(scores.contains(catalog::ItemKey{ catalog::ItemKind::Place, "p3" }));
        EXPECT_TRUE(scores.contains(catalog::ItemKey{ catalog::ItemKind::Activity, "a1" }));
        for (const catalog::ScoreMap::Entry& entry : scores)
        {
            EXPECT_GT(entry.score, 0.);
            EXPECT_LE(entry.score, 1.);
        }

        const catalog::ScoreMap limitedScores{ service->query(interactions, candidates, "Paris", 1) };
        ASSERT_EQ(limitedScores.size(), 1);
        EXPECT_EQ(limitedScores.begin()->itemKey, scores.begin()->itemKey);
    }

    TEST(TfIdf, serviceQueryWithoutLikedItems)
    {
        auto service{ createTfIdfSemanticService() };
        service->upsert(candidates);

        // "places and activities in paris" only matches the club description
        const catalog::ScoreMap scores{ service->query({}, candidates, "Paris", 10) };
        EXPECT_EQ(getItemIds(scores), std::vector<std::string>{ "p2" });
    }

    TEST(TfIdf, serviceQueryRestrictedToCandidates)
    {
        auto service{ createTfIdfSemanticService() };
        service->upsert(candidates);

        const catalog::ItemContainer restrictedCandidates{ candidates[0], candidates[3] };
        const catalog::InteractionContainer interactions{ createInteraction(catalog::ItemKind::Place, "p1", catalog::Rating::Like) };

        const catalog::ScoreMap scores{ service->query(interactions, restrictedCandidates, "Paris", 10) };
        EXPECT_EQ(getItemIds(scores), std::vector<std::string>{ "a1" });

        EXPECT_TRUE(service->query(interactions, {}, "Paris", 10).empty());
        EXPECT_TRUE(service->query(interactions, candidates, "Paris", 0).empty());
    }

    TEST(TfIdf, serviceQueryDistinguishesKinds)
    {
        const catalog::ItemContainer sameIdCandidates{
            createItem(catalog::ItemKind::Place, "1", "Old museum", "art"),
            createItem(catalog::ItemKind::Activity, "1", "Workshop", "art"),
        };

        auto service{ createTfIdfSemanticService() };
        service->upsert(sameIdCandidates);

        // only the activity is excluded
        const catalog::ScoreMap scores{ service->query({ createInteraction(catalog::ItemKind::Activity, "1", catalog::Rating::Like) }, sameIdCandidates, "Paris", 10) };
        ASSERT_EQ(scores.size(), 1);
        EXPECT_EQ(scores.begin()->itemKey, (catalog::ItemKey{ catalog::ItemKind::Place, "1" }));

        // both kinds are kept when none is excluded
        const catalog::ItemContainer moreCandidates{ sameIdCandidates[0], sameIdCandidates[1], createItem(catalog::ItemKind::Place, "2", "Gallery", "art") };
        service->upsert(moreCandidates);
        const catalog::ScoreMap likedScores{ service->query({ createInteraction(catalog::ItemKind::Place, "2", catalog::Rating::Like) }, moreCandidates, "Paris", 10) };
        ASSERT_EQ(likedScores.size(), 2);
        EXPECT_TRUE(likedScores.contains(catalog::ItemKey{ catalog::ItemKind::Place, "1" }));
        EXPECT_TRUE(likedScores.contains(catalog::ItemKey{ catalog::ItemKind::Activity, "1" }));
    }

    TEST(TfIdf, serviceUpsertIdempotent)
    {
        auto service{ createTfIdfSemanticService() };
        service->upsert(candidates);

        const catalog::InteractionContainer interactions{ createInteraction(catalog::ItemKind::Place, "p1", catalog::Rating::Like) };
        const catalog::ScoreMap scores{ service->query(interactions, candidates, "Paris", 10) };

        service->upsert(candidates);
        const catalog::ScoreMap scoresAfterUpsert{ service->query(interactions, candidates, "Paris", 10) };

        ASSERT_EQ(getItemIds(scores), getItemIds(scoresAfterUpsert));
        for (const catalog::ScoreMap::Entry& entry : scores)
            EXPECT_DOUBLE_EQ(entry.score, scoresAfterUpsert.getScore(entry.itemKey));
    }

    TEST(TfIdf, serviceQueryNotIndexed)
    {
        auto service{ createTfIdfSemanticService() };
        EXPECT_TRUE(service->query({}, candidates, "Paris", 10).empty());
    }
} // namespace trippy::semantic::tests
