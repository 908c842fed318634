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

#include "TfIdfIndex.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace trippy::semantic
{
    namespace
    {
        bool isTokenChar(unsigned char c)
        {
            return c >= 0x80 || std::isalnum(c);
        }

        TfIdfIndex::WeightedTerms normalize(TfIdfIndex::WeightedTerms weights)
        {
            double norm{};
            for (const auto& [term, weight] : weights)
                norm += weight * weight;

            norm = std::sqrt(norm);
            if (norm == 0)
                return {};

            for (auto& [term, weight] : weights)
                weight /= norm;

            return weights;
        }
    } // namespace

    std::vector<std::string> tokenize(std::string_view text)
    {
        std::vector<std::string> tokens;

        std::string currentToken;
        for (const char c : text)
        {
            if (isTokenChar(static_cast<unsigned char>(c)))
            {
                currentToken.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                continue;
            }

            if (!currentToken.empty())
                tokens.push_back(std::move(currentToken));
            currentToken.clear();
        }

        if (!currentToken.empty())
            tokens.push_back(std::move(currentToken));

        return tokens;
    }

    void TfIdfIndex::upsert(const DocumentKey& key, std::string_view text)
    {
        TermFrequencies termFrequencies;
        for (std::string& token : tokenize(text))
            termFrequencies[std::move(token)]++;

        const auto itIndex{ _documentIndexes.find(key) };
        if (itIndex == std::cend(_documentIndexes))
        {
            _documentIndexes.emplace(key, _documents.size());
            _documents.push_back(Document{ key, {} });
        }

        Document& document{ _documents[_documentIndexes.find(key)->second] };

        // update document frequencies with the differences only
        for (const auto& [term, frequency] : document.termFrequencies)
        {
            if (!termFrequencies.contains(term))
            {
                auto itDocumentFrequency{ _documentFrequencies.find(term) };
                if (--itDocumentFrequency->second == 0)
                    _documentFrequencies.erase(itDocumentFrequency);
            }
        }
        for (const auto& [term, frequency] : termFrequencies)
        {
            if (!document.termFrequencies.contains(term))
                _documentFrequencies[term]++;
        }

        document.termFrequencies = std::move(termFrequencies);
    }

    std::vector<TfIdfIndex::Hit> TfIdfIndex::search(std::string_view query) const
    {
        std::vector<Hit> hits;

        TermFrequencies queryTermFrequencies;
        for (std::string& token : tokenize(query))
        {
            // terms unknown to the index cannot contribute to any similarity
            if (_documentFrequencies.contains(token))
                queryTermFrequencies[std::move(token)]++;
        }

        const WeightedTerms queryWeights{ normalize(computeWeights(queryTermFrequencies)) };
        if (queryWeights.empty())
            return hits;

        for (const Document& document : _documents)
        {
            const WeightedTerms documentWeights{ normalize(computeWeights(document.termFrequencies)) };

            double score{};
            for (const auto& [term, queryWeight] : queryWeights)
            {
                const auto it{ documentWeights.find(term) };
                if (it != std::cend(documentWeights))
                    score += queryWeight * it->second;
            }

            if (score > 0)
                hits.push_back(Hit{ document.key, std::min(score, 1.) });
        }

        std::stable_sort(std::begin(hits), std::end(hits), [](const Hit& lhs, const Hit& rhs) { return lhs.score > rhs.score; });

        return hits;
    }

    double TfIdfIndex::computeIdf(const std::string& term) const
    {
        const auto it{ _documentFrequencies.find(term) };
        const double documentFrequency{ it != std::cend(_documentFrequencies) ? static_cast<double>(it->second) : 0. };

        // smoothed, always strictly positive
        return std::log((1. + _documents.size()) / (1. + documentFrequency)) + 1.;
    }

    TfIdfIndex::WeightedTerms TfIdfIndex::computeWeights(const TermFrequencies& termFrequencies) const
    {
        WeightedTerms weights;
        for (const auto& [term, frequency] : termFrequencies)
            weights.emplace(term, static_cast<double>(frequency) * computeIdf(term));

        return weights;
    }
} // namespace trippy::semantic
