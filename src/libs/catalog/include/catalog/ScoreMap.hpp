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
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "catalog/Types.hpp"

namespace trippy::catalog
{
    // item -> score, iterated in insertion order
    class ScoreMap
    {
    public:
        struct Entry
        {
            ItemKey itemKey;
            double score{};
        };
        using const_iterator = std::vector<Entry>::const_iterator;

        // Accumulates if the item is already present, appends otherwise
        void add(const ItemKey& itemKey, double score);
        void set(const ItemKey& itemKey, double score);

        std::optional<double> find(const ItemKey& itemKey) const;
        double getScore(const ItemKey& itemKey) const { return find(itemKey).value_or(0.); }
        bool contains(const ItemKey& itemKey) const { return _indexes.find(itemKey) != std::cend(_indexes); }

        std::size_t size() const { return _entries.size(); }
        bool empty() const { return _entries.empty(); }
        const_iterator begin() const { return std::cbegin(_entries); }
        const_iterator end() const { return std::cend(_entries); }

        std::optional<double> getMaxScore() const;

        // Stable: equal scores keep their relative order
        void sortByDescendingScore();
        void truncate(std::size_t maxCount);
        void eraseIf(std::function<bool(const Entry&)> predicate);
        void transformScores(std::function<double(double)> func);

    private:
        void rebuildIndexes();

        std::vector<Entry> _entries;
        std::map<ItemKey, std::size_t> _indexes;
    };
} // namespace trippy::catalog
