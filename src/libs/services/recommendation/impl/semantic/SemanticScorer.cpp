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

#include "SemanticScorer.hpp"

#include "core/ILogger.hpp"
#include "services/semantic/ISemanticService.hpp"

namespace trippy::recommendation
{
    SemanticScorer::SemanticScorer(semantic::ISemanticService* semanticService)
        : _semanticService{ semanticService }
    {
    }

    void SemanticScorer::index(const catalog::ItemContainer& items) const
    {
        if (!_semanticService)
            return;

        try
        {
            _semanticService->upsert(items);
        }
        catch (const std::exception& e)
        {
            TRIPPY_LOG(RECOMMENDATION, WARNING, "Cannot index items in semantic service: " << e.what());
        }
    }

    catalog::ScoreMap SemanticScorer::recommend(const ScoringContext& context, std::size_t maxCount) const
    {
        catalog::ScoreMap res;

        if (!_semanticService)
            return res;

        try
        {
            res = _semanticService->query(context.userInteractions, context.candidates, context.destination, maxCount);
        }
        catch (const std::exception& e)
        {
            TRIPPY_LOG(RECOMMENDATION, WARNING, "Semantic query failed for user '" << context.user.id << "': " << e.what());
            return {};
        }

        // scores are used as is, the provider is expected to report them in [0, 1]
        for (const catalog::ScoreMap::Entry& entry : res)
            TRIPPY_LOG_IF(RECOMMENDATION, WARNING, (entry.score < 0 || entry.score > 1), "Semantic score out of range for " << catalog::toString(entry.itemKey.kind) << " '" << entry.itemKey.id << "': " << entry.score);

        res.sortByDescendingScore();
        res.truncate(maxCount);

        return res;
    }
} // namespace trippy::recommendation
