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

#include "UserSimilarityScorer.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "catalog/ICatalog.hpp"
#include "core/ILogger.hpp"

namespace trippy::recommendation
{
    namespace
    {
        using RatingVector = std::map<catalog::ItemKey, int>;

        // last rating wins if the same item was rated several times
        RatingVector getRatingVector(const catalog::InteractionContainer& interactions)
        {
            RatingVector res;
            for (const catalog::Interaction& interaction : interactions)
                res[interaction.getItemKey()] = catalog::getRatingValue(interaction.rating);

            return res;
        }
    } // namespace

    double computeUserSimilarity(const catalog::InteractionContainer& interactions, const catalog::InteractionContainer& otherInteractions)
    {
        const RatingVector ratings{ getRatingVector(interactions) };
        const RatingVector otherRatings{ getRatingVector(otherInteractions) };

        double dotProduct{};
        double norm{};
        double otherNorm{};
        for (const auto& [itemKey, rating] : ratings)
        {
            const auto itOther{ otherRatings.find(itemKey) };
            if (itOther == std::cend(otherRatings))
                continue;

            dotProduct += rating * itOther->second;
            norm += rating * rating;
            otherNorm += itOther->second * itOther->second;
        }

        if (norm == 0 || otherNorm == 0)
            return 0;

        const double similarity{ dotProduct / (std::sqrt(norm) * std::sqrt(otherNorm)) };
        return std::clamp(similarity, 0., 1.);
    }

    UserSimilarityScorer::UserSimilarityScorer(const catalog::ICatalog& catalog, std::size_t neighborCount)
        : _catalog{ catalog }
        , _neighborCount{ neighborCount }
    {
    }

    std::vector<UserSimilarityScorer::Neighbor> UserSimilarityScorer::findSimilarUsers(const catalog::User& user, const catalog::InteractionContainer& userInteractions) const
    {
        std::vector<Neighbor> neighbors;

        for (const catalog::User& otherUser : _catalog.getAllUsers())
        {
            if (otherUser.id == user.id)
                continue;

            const double similarity{ computeUserSimilarity(userInteractions, _catalog.getUserInteractions(otherUser.id)) };
            if (similarity > 0)
                neighbors.push_back(Neighbor{ otherUser.id, similarity });
        }

        std::stable_sort(std::begin(neighbors), std::end(neighbors), [](const Neighbor& lhs, const Neighbor& rhs) { return lhs.similarity > rhs.similarity; });
        if (neighbors.size() > _neighborCount)
            neighbors.resize(_neighborCount);

        return neighbors;
    }

    catalog::ScoreMap UserSimilarityScorer::recommend(const ScoringContext& context, std::size_t maxCount) const
    {
        catalog::ScoreMap res;

        const std::vector<Neighbor> neighbors{ findSimilarUsers(context.user, context.userInteractions) };
        TRIPPY_LOG(RECOMMENDATION, DEBUG, "Found " << neighbors.size() << " similar users for user '" << context.user.id << "'");
        if (neighbors.empty())
            return res;

        std::set<catalog::ItemKey> excludedItems;
        for (const catalog::Interaction& interaction : context.userInteractions)
            excludedItems.insert(interaction.getItemKey());

        for (const Neighbor& neighbor : neighbors)
        {
            for (const catalog::Interaction& interaction : _catalog.getUserInteractions(neighbor.userId))
            {
                if (!interaction.isPositive())
                    continue;

                const catalog::ItemKey itemKey{ interaction.getItemKey() };
                if (excludedItems.contains(itemKey))
                    continue;

                res.add(itemKey, neighbor.similarity * catalog::getRatingValue(interaction.rating));
            }
        }

        if (const std::optional<double> maxScore{ res.getMaxScore() }; maxScore && *maxScore > 0)
            res.transformScores([&](double score) { return score / *maxScore; });

        std::set<catalog::ItemKey> candidateKeys;
        for (const catalog::Item& candidate : context.candidates)
            candidateKeys.insert(candidate.getKey());
        res.eraseIf([&](const catalog::ScoreMap::Entry& entry) { return !candidateKeys.contains(entry.itemKey); });

        res.sortByDescendingScore();
        res.truncate(maxCount);

        return res;
    }
} // namespace trippy::recommendation
