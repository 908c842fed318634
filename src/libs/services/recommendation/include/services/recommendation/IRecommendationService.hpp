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

#include <cstddef>
#include <memory>
#include <string_view>

#include "services/recommendation/Types.hpp"

namespace trippy::catalog
{
    class ICatalog;
    struct User;
} // namespace trippy::catalog

namespace trippy::semantic
{
    class ISemanticService;
}

namespace trippy::recommendation
{
    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // Blends collaborative, content and semantic scores, then applies the age suitability multiplier
        // Returns at most maxCount items located in the destination
        virtual RecommendationContainer getRecommendations(const catalog::User& user, std::string_view destination, std::size_t maxCount) const = 0;

        // Unknown user yields an empty result
        virtual RecommendationContainer getRecommendations(std::string_view userId, std::string_view destination, std::size_t maxCount) const = 0;
    };

    // semanticService may be null, semantic scores are then considered as missing
    std::unique_ptr<IRecommendationService> createRecommendationService(catalog::ICatalog& catalog, semantic::ISemanticService* semanticService, const Settings& settings = {});
} // namespace trippy::recommendation
