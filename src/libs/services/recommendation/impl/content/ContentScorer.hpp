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

#include <functional>
#include <map>
#include <string>

#include "IScorer.hpp"

namespace trippy::catalog
{
    class ICatalog;
}

namespace trippy::recommendation
{
    // lowercase feature (category, energy level, tag or age suitability profile) -> weight
    using FeatureWeights = std::map<std::string, double, std::less<>>;

    class ContentScorer final : public IScorer
    {
    public:
        ContentScorer(const catalog::ICatalog& catalog);
        ~ContentScorer() override = default;
        ContentScorer(const ContentScorer&) = delete;
        ContentScorer& operator=(const ContentScorer&) = delete;

        // Built from the liked items, empty if there is none
        FeatureWeights extractProfile(const catalog::InteractionContainer& userInteractions) const;

        // In [0, 1], 0.5 if the profile is empty
        static double scoreItem(const catalog::Item& item, const FeatureWeights& profile);

        catalog::ScoreMap recommend(const ScoringContext& context, std::size_t maxCount) const override;

    private:
        const catalog::ICatalog& _catalog;
    };
} // namespace trippy::recommendation
