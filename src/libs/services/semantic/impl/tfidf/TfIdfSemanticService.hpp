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

#include <shared_mutex>

#include "services/semantic/ISemanticService.hpp"

#include "TfIdfIndex.hpp"

namespace trippy::semantic
{
    class TfIdfSemanticService final : public ISemanticService
    {
    public:
        TfIdfSemanticService() = default;
        ~TfIdfSemanticService() override = default;
        TfIdfSemanticService(const TfIdfSemanticService&) = delete;
        TfIdfSemanticService& operator=(const TfIdfSemanticService&) = delete;

    private:
        void upsert(const catalog::ItemContainer& items) override;
        catalog::ScoreMap query(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination, std::size_t maxCount) const override;

        catalog::ScoreMap doQuery(const catalog::InteractionContainer& userInteractions, const catalog::ItemContainer& candidates, std::string_view destination, std::size_t maxCount) const;

        mutable std::shared_mutex _mutex;
        TfIdfIndex _index;
    };
} // namespace trippy::semantic
