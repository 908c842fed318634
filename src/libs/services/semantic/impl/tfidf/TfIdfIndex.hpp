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
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace trippy::semantic
{
    // Lowercase ASCII alphanumeric tokens, non ASCII bytes are kept in tokens
    std::vector<std::string> tokenize(std::string_view text);

    // In memory TF-IDF index, documents are compared using the cosine similarity
    class TfIdfIndex
    {
    public:
        using DocumentKey = std::string;
        using WeightedTerms = std::unordered_map<std::string, double>;

        struct Hit
        {
            DocumentKey key;
            double score{}; // in ]0, 1]
        };

        // Replaces the document if the key already exists
        void upsert(const DocumentKey& key, std::string_view text);

        std::size_t getDocumentCount() const { return _documents.size(); }
        bool contains(const DocumentKey& key) const { return _documentIndexes.contains(key); }

        // Only documents sharing at least one term with the query are reported
        // Sorted by descending score, ties in insertion order
        std::vector<Hit> search(std::string_view query) const;

    private:
        using TermFrequencies = std::unordered_map<std::string, std::size_t>;

        struct Document
        {
            DocumentKey key;
            TermFrequencies termFrequencies;
        };

        double computeIdf(const std::string& term) const;
        WeightedTerms computeWeights(const TermFrequencies& termFrequencies) const;

        std::vector<Document> _documents;
        std::map<DocumentKey, std::size_t, std::less<>> _documentIndexes;
        TermFrequencies _documentFrequencies; // term -> number of documents containing it
    };
} // namespace trippy::semantic
