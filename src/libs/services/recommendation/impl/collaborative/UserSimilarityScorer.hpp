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
#include <vector>

#include "IScorer.hpp"

namespace trippy::catalog
{
    class ICatalog;
}

namespace trippy::recommendation
{
    // Cosine similarity of the ratings given to the items both users interacted with, in [0, 1]
    double computeUserSimilarity(const catalog::InteractionContainer& interactions, const catalog::InteractionContainer& otherInteractions);

    class UserSimilarityScorer final : public IScorer
    {
    public:
        UserSimilarityScorer(const catalog::ICatalog& catalog, std::size_t neighborCount);
        ~UserSimilarityScorer() override = default;
        UserSimilarityScorer(const UserSimilarityScorer&) = delete;
        UserSimilarityScorer& operator=(const UserSimilarityScorer&) = delete;

        struct Neighbor
        {
            std::string userId;
            double similarity{};
        };
        // Sorted by descending similarity, only users sharing positive similarity are reported
        std::vector<Neighbor> findSimilarUsers(const catalog::User& user, const catalog::InteractionContainer& userInteractions) const;

        catalog::ScoreMap recommend(const ScoringContext& context, std::size_t maxCount) const override;

    private:
        const catalog::ICatalog& _catalog;
        const std::size_t _neighborCount;
    };
} // namespace trippy::recommendation
