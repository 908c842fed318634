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

#include "AgeSuitability.hpp"

#include <algorithm>
#include <optional>

#include "core/String.hpp"

namespace trippy::recommendation
{
    namespace
    {
        bool isInRange(unsigned age, unsigned min, unsigned max)
        {
            return age >= min && age <= max;
        }

        double computeRawMultiplier(unsigned age, const catalog::Item& item)
        {
            using namespace core::stringUtils;

            // unknown levels match no energy rule
            const std::optional<catalog::EnergyLevel> energyLevel{ catalog::parseEnergyLevel(item.features.getEnergyLevelOrDefault()) };
            const std::string_view profile{ item.features.ageSuitabilityProfile };
            const std::string_view category{ item.category };

            // first matching rule wins
            if (energyLevel == catalog::EnergyLevel::High || stringCaseInsensitiveContains(profile, "nightlife") || stringCaseInsensitiveContains(category, "club"))
            {
                if (isInRange(age, 18, 35))
                    return 1.3;
                if (isInRange(age, 36, 50))
                    return 1.0;
                return 0.6;
            }

            if (energyLevel == catalog::EnergyLevel::Low || stringCaseInsensitiveContains(profile, "cultural") || stringCaseInsensitiveContains(category, "museum"))
                return age >= 30 ? 1.1 : 1.0;

            if (stringCaseInsensitiveContains(profile, "family") || stringCaseInsensitiveContains(category, "family-friendly"))
            {
                if (isInRange(age, 25, 45))
                    return 1.2;
                if (age < 25)
                    return 0.9;
                return 1.1;
            }

            if (stringCaseInsensitiveContains(profile, "educational") || stringCaseInsensitiveContains(category, "educational"))
                return age >= 40 ? 1.15 : 1.0;

            if (energyLevel == catalog::EnergyLevel::Medium)
                return isInRange(age, 25, 45) ? 1.1 : 1.0;

            return 1.0;
        }
    } // namespace

    double computeAgeMultiplier(unsigned age, const catalog::Item& item)
    {
        return std::clamp(computeRawMultiplier(age, item), minAgeMultiplier, maxAgeMultiplier);
    }
} // namespace trippy::recommendation
