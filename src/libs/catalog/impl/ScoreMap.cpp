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

#include "catalog/ScoreMap.hpp"

#include <algorithm>

namespace trippy::catalog
{
    void ScoreMap::add(const ItemKey& itemKey, double score)
    {
        const auto it{ _indexes.find(itemKey) };
        if (it != std::cend(_indexes))
        {
            _entries[it->second].score += score;
            return;
        }

        _indexes.emplace(itemKey, _entries.size());
        _entries.push_back(Entry{ itemKey, score });
    }

    void ScoreMap::set(const ItemKey& itemKey, double score)
    {
        const auto it{ _indexes.find(itemKey) };
        if (it != std::cend(_indexes))
        {
            _entries[it->second].score = score;
            return;
        }

        _indexes.emplace(itemKey, _entries.size());
        _entries.push_back(Entry{ itemKey, score });
    }

    std::optional<double> ScoreMap::find(const ItemKey& itemKey) const
    {
        const auto it{ _indexes.find(itemKey) };
        if (it == std::cend(_indexes))
            return std::nullopt;

        return _entries[it->second].score;
    }

    std::optional<double> ScoreMap::getMaxScore() const
    {
        if (_entries.empty())
            return std::nullopt;

        return std::max_element(std::cbegin(_entries), std::cend(_entries), [](const Entry& lhs, const Entry& rhs) { return lhs.score < rhs.score; })->score;
    }

    void ScoreMap::sortByDescendingScore()
    {
        std::stable_sort(std::begin(_entries), std::end(_entries), [](const Entry& lhs, const Entry& rhs) { return lhs.score > rhs.score; });
        rebuildIndexes();
    }

    void ScoreMap::truncate(std::size_t maxCount)
    {
        if (_entries.size() <= maxCount)
            return;

        _entries.resize(maxCount);
        rebuildIndexes();
    }

    void ScoreMap::eraseIf(std::function<bool(const Entry&)> predicate)
    {
        const auto itRemoved{ std::remove_if(std::begin(_entries), std::end(_entries), predicate) };
        if (itRemoved == std::end(_entries))
            return;

        _entries.erase(itRemoved, std::end(_entries));
        rebuildIndexes();
    }

    void ScoreMap::transformScores(std::function<double(double)> func)
    {
        for (Entry& entry : _entries)
            entry.score = func(entry.score);
    }

    void ScoreMap::rebuildIndexes()
    {
        _indexes.clear();
        for (std::size_t i{}; i < _entries.size(); ++i)
            _indexes.emplace(_entries[i].itemKey, i);
    }
} // namespace trippy::catalog
