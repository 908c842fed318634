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

#include "IScorer.hpp"

namespace trippy::semantic
{
    class ISemanticService;
}

namespace trippy::recommendation
{
    // Boundary with the semantic provider: never throws, a missing provider yields no scores
    class SemanticScorer final : public IScorer
    {
    public:
        SemanticScorer(semantic::ISemanticService* semanticService);
        ~SemanticScorer() override = default;
        SemanticScorer(const SemanticScorer&) = delete;
        SemanticScorer& operator=(const SemanticScorer&) = delete;

        // Best effort
        void index(const catalog::ItemContainer& items) const;

        catalog::ScoreMap recommend(const ScoringContext& context, std::size_t maxCount) const override;

    private:
        semantic::ISemanticService* _semanticService;
    };
} // namespace trippy::recommendation
