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

#include "ContentScorer.hpp"

#include <algorithm>

#include "catalog/ICatalog.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace trippy::recommendation
{
    namespace
    {
        constexpr double neutralScore{ 0.5 };
        constexpr double tagWeightFactor{ 0.5 };

        template<typename Func>
        void visitFeatures(const catalog::Item& item, Func func)
        {
            func(core::stringUtils::stringToLower(item.category), 1.);
            func(std::string{ item.features.getEnergyLevelOrDefault() }, 1.);
            for (const std::string& tag : item.features.tags)
                func(core::stringUtils::stringToLower(tag), tagWeightFactor);
            if (!item.features.ageSuitabilityProfile.empty())
                func(core::stringUtils::stringToLower(item.features.ageSuitabilityProfile), 1.);
        }
    } // namespace

    ContentScorer::ContentScorer(const catalog::ICatalog& catalog)
        : _catalog{ catalog }
    {
    }

    FeatureWeights ContentScorer::extractProfile(const catalog::InteractionContainer& userInteractions) const
    {
        FeatureWeights profile;
        double totalWeight{};

        for (const catalog::Interaction& interaction : userInteractions)
        {
            if (!interaction.isPositive())
                continue;

            const std::optional<catalog::Item> item{ _catalog.findItem(interaction.itemType, interaction.itemId) };
            if (!item)
            {
                TRIPPY_LOG(RECOMMENDATION, DEBUG, "Skipping interaction on unknown " << catalog::toString(interaction.itemType) << " '" << interaction.itemId << "'");
                continue;
            }

            const double weight{ static_cast<double>(catalog::getRatingValue(interaction.rating)) };
            // tags weigh as much as the other features in the profile
            visitFeatures(*item, [&](const std::string& feature, double) { profile[feature] += weight; });
            totalWeight += weight;
        }

        if (totalWeight > 0)
        {
            for (auto& [feature, featureWeight] : profile)
                featureWeight /= totalWeight;
        }

        return profile;
    }

    double ContentScorer::scoreItem(const catalog::Item& item, const FeatureWeights& profile)
    {
        if (profile.empty())
            return neutralScore;

        double score{};
        std::size_t matchCount{};
        visitFeatures(item, [&](const std::string& feature, double factor) {
            const auto it{ profile.find(feature) };
            if (it == std::cend(profile))
                return;

            score += it->second * factor;
            matchCount++;
        });

        if (matchCount == 0)
            return 0;

        return std::clamp(score / static_cast<double>(matchCount + 1), 0., 1.);
    }

    catalog::ScoreMap ContentScorer::recommend(const ScoringContext& context, std::size_t maxCount) const
    {
        catalog::ScoreMap res;

        const FeatureWeights profile{ extractProfile(context.userInteractions) };
        TRIPPY_LOG(RECOMMENDATION, DEBUG, "Content profile for user '" << context.user.id << "' has " << profile.size() << " features");

        for (const catalog::Item& candidate : context.candidates)
        {
            const catalog::ItemKey itemKey{ candidate.getKey() };
            if (!res.contains(itemKey))
                res.set(itemKey, scoreItem(candidate, profile));
        }

        res.sortByDescendingScore();
        res.truncate(maxCount);

        return res;
    }
} // namespace trippy::recommendation
