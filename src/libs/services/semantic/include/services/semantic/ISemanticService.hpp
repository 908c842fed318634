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

#include "catalog/Interaction.hpp"
#include "catalog/Item.hpp"
#include "catalog/ScoreMap.hpp"
#include "core/Exception.hpp"

namespace trippy::semantic
{
    class Exception : public core::TrippyException
    {
    public:
        using TrippyException::TrippyException;
    };

    class ISemanticService
    {
    public:
        virtual ~ISemanticService() = default;

        // Idempotent, best effort: failures are logged and not reported
        virtual void upsert(const catalog::ItemContainer& items) = 0;

        // Scores are in [0, 1], sorted by descending score
        // Items the user interacted with are excluded, only candidates are reported
        // Returns an empty map on failure
        virtual catalog::ScoreMap query(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination, std::size_t maxCount) const = 0;
    };

    std::unique_ptr<ISemanticService> createTfIdfSemanticService();
} // namespace trippy::semantic
