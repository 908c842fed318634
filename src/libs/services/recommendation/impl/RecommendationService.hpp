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

#include "services/recommendation/IRecommendationService.hpp"

#include "collaborative/UserSimilarityScorer.hpp"
#include "content/ContentScorer.hpp"
#include "semantic/SemanticScorer.hpp"

namespace trippy::recommendation
{
    class RecommendationService final : public IRecommendationService
    {
    public:
        RecommendationService(catalog::ICatalog& catalog, semantic::ISemanticService* semanticService, const Settings& settings);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

    private:
        RecommendationContainer getRecommendations(const catalog::User& user, std::string_view destination, std::size_t maxCount) const override;
        RecommendationContainer getRecommendations(std::string_view userId, std::string_view destination, std::size_t maxCount) const override;

        static constexpr double collaborativeWeight{ 0.4 };
        static constexpr double contentWeight{ 0.3 };
        static constexpr double semanticWeight{ 0.3 };
        static constexpr std::size_t scorerCountFactor{ 3 }; // each scorer is asked for more items than requested
        static std::size_t getScorerMaxCount(std::size_t maxCount);

        catalog::ICatalog& _catalog;
        UserSimilarityScorer _userSimilarityScorer;
        ContentScorer _contentScorer;
        SemanticScorer _semanticScorer;
    };
} // namespace trippy::recommendation
