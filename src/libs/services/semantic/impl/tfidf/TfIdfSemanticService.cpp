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

#include "TfIdfSemanticService.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "core/ILogger.hpp"
#include "services/semantic/QueryText.hpp"

namespace trippy::semantic
{
    namespace
    {
        // ids are only unique among items of the same kind
        std::string getDocumentKey(catalog::ItemKind kind, std::string_view itemId)
        {
            std::string key{ catalog::toString(kind) };
            key += '_';
            key += itemId;

            return key;
        }
    } // namespace

    std::unique_ptr<ISemanticService> createTfIdfSemanticService()
    {
        return std::make_unique<TfIdfSemanticService>();
    }

    void TfIdfSemanticService::upsert(const catalog::ItemContainer& items)
    {
        try
        {
            const std::unique_lock lock{ _mutex };

            for (const catalog::Item& item : items)
                _index.upsert(getDocumentKey(item.getKind(), item.id), getItemText(item));

            TRIPPY_LOG(SEMANTIC, DEBUG, "Upserted " << items.size() << " items, index now contains " << _index.getDocumentCount() << " documents");
        }
        catch (const std::exception& e)
        {
            TRIPPY_LOG(SEMANTIC, WARNING, "Cannot upsert items: " << e.what());
        }
    }

    catalog::ScoreMap TfIdfSemanticService::query(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination, std::size_t maxCount) const
    {
        try
        {
            return doQuery(userInteractions, candidates, destination, maxCount);
        }
        catch (const std::exception& e)
        {
            TRIPPY_LOG(SEMANTIC, WARNING, "Semantic query failed: " << e.what());
        }

        return {};
    }

    catalog::ScoreMap TfIdfSemanticService::doQuery(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination, std::size_t maxCount) const
    {
        catalog::ScoreMap res;

        if (maxCount == 0 || candidates.empty())
            return res;

        std::set<std::string, std::less<>> interactedKeys;
        for (const catalog::Interaction& interaction : userInteractions)
            interactedKeys.insert(getDocumentKey(interaction.itemType, interaction.itemId));

        std::map<std::string, const catalog::Item*, std::less<>> candidatesByKey;
        for (const catalog::Item& candidate : candidates)
            candidatesByKey.emplace(getDocumentKey(candidate.getKind(), candidate.id), &candidate);

        const std::string queryText{ buildQueryText(userInteractions, candidates, destination) };
        TRIPPY_LOG(SEMANTIC, DEBUG, "Query text = '" << queryText << "'");

        std::vector<TfIdfIndex::Hit> hits;
        {
            const std::shared_lock lock{ _mutex };
            hits = _index.search(queryText);
        }

        for (const TfIdfIndex::Hit& hit : hits)
        {
            if (interactedKeys.contains(hit.key))
                continue;

            const auto itCandidate{ candidatesByKey.find(hit.key) };
            if (itCandidate == std::cend(candidatesByKey))
                continue;

            res.set(itCandidate->second->getKey(), hit.score);
            if (res.size() == maxCount)
                break;
        }

        TRIPPY_LOG(SEMANTIC, DEBUG, "Found " << res.size() << " semantic matches out of " << hits.size() << " hits");

        return res;
    }
} // namespace trippy::semantic
