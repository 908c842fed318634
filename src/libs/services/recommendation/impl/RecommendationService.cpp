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

#include "RecommendationService.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "catalog/ICatalog.hpp"
#include "core/ILogger.hpp"

#include "AgeSuitability.hpp"

namespace trippy::recommendation
{
    namespace
    {
        const catalog::Item* findCandidate(const catalog::ItemContainer& candidates, const catalog::ItemKey& itemKey)
        {
            const auto it{ std::find_if(std::cbegin(candidates), std::cend(candidates), [&](const catalog::Item& item) { return item.getKind() == itemKey.kind && item.id == itemKey.id; }) };
            return it != std::cend(candidates) ? &(*it) : nullptr;
        }

        // collaborative items first, then the new content items, then the new semantic items
        std::vector<catalog::ItemKey> mergeItemKeys(std::initializer_list<const catalog::ScoreMap*> scoreMaps)
        {
            std::vector<catalog::ItemKey> res;
            std::set<catalog::ItemKey> seenItemKeys;
            for (const catalog::ScoreMap* scoreMap : scoreMaps)
            {
                for (const catalog::ScoreMap::Entry& entry : *scoreMap)
                {
                    if (seenItemKeys.insert(entry.itemKey).second)
                        res.push_back(entry.itemKey);
                }
            }

            return res;
        }
    } // namespace

    std::unique_ptr<IRecommendationService> createRecommendationService(catalog::ICatalog& catalog, semantic::ISemanticService* semanticService, const Settings& settings)
    {
        return std::make_unique<RecommendationService>(catalog, semanticService, settings);
    }

    RecommendationService::RecommendationService(catalog::ICatalog& catalog, semantic::ISemanticService* semanticService, const Settings& settings)
        : _catalog{ catalog }
        , _userSimilarityScorer{ catalog, settings.neighborCount }
        , _contentScorer{ catalog }
        , _semanticScorer{ semanticService }
    {
        TRIPPY_LOG(RECOMMENDATION, INFO, "Recommendation service started, neighbor count = " << settings.neighborCount << ", semantic scores " << (semanticService ? "enabled" : "disabled"));
    }

    std::size_t RecommendationService::getScorerMaxCount(std::size_t maxCount)
    {
        // saturates
        if (maxCount > std::numeric_limits<std::size_t>::max() / scorerCountFactor)
            return std::numeric_limits<std::size_t>::max();

        return maxCount * scorerCountFactor;
    }

    RecommendationContainer RecommendationService::getRecommendations(const catalog::User& user, std::string_view destination, std::size_t maxCount) const
    {
        RecommendationContainer res;

        if (maxCount == 0)
            return res;

        const catalog::ItemContainer candidates{ _catalog.getCandidateItems(destination) };
        if (candidates.empty())
        {
            TRIPPY_LOG(RECOMMENDATION, DEBUG, "No candidate item found in destination '" << destination << "'");
            return res;
        }

        _semanticScorer.index(candidates);

        const catalog::InteractionContainer userInteractions{ _catalog.getUserInteractions(user.id) };
        const ScoringContext context{ user, userInteractions, candidates, destination };
        const std::size_t scorerMaxCount{ getScorerMaxCount(maxCount) };

        const catalog::ScoreMap collaborativeScores{ _userSimilarityScorer.recommend(context, scorerMaxCount) };
        const catalog::ScoreMap contentScores{ _contentScorer.recommend(context, scorerMaxCount) };
        const catalog::ScoreMap semanticScores{ _semanticScorer.recommend(context, scorerMaxCount) };

        TRIPPY_LOG(RECOMMENDATION, DEBUG, "User '" << user.id << "', destination '" << destination << "': " << candidates.size() << " candidates, "
                                                   << collaborativeScores.size() << " collaborative scores, "
                                                   << contentScores.size() << " content scores, "
                                                   << semanticScores.size() << " semantic scores");

        for (const catalog::ItemKey& itemKey : mergeItemKeys({ &collaborativeScores, &contentScores, &semanticScores }))
        {
            const catalog::Item* item{ findCandidate(candidates, itemKey) };
            if (!item)
                continue;

            const double baseScore{ collaborativeWeight * collaborativeScores.getScore(itemKey)
                                    + contentWeight * contentScores.getScore(itemKey)
                                    + semanticWeight * semanticScores.getScore(itemKey) };

            res.push_back(Recommendation{ *item, baseScore * computeAgeMultiplier(user.age, *item) });
        }

        std::stable_sort(std::begin(res), std::end(res), [](const Recommendation& lhs, const Recommendation& rhs) { return lhs.score > rhs.score; });
        if (res.size() > maxCount)
            res.resize(maxCount);

        return res;
    }

    RecommendationContainer RecommendationService::getRecommendations(std::string_view userId, std::string_view destination, std::size_t maxCount) const
    {
        const std::optional<catalog::User> user{ _catalog.findUser(userId) };
        if (!user)
        {
            TRIPPY_LOG(RECOMMENDATION, DEBUG, "Unknown user '" << userId << "'");
            return {};
        }

        return getRecommendations(*user, destination, maxCount);
    }
} // namespace trippy::recommendation
