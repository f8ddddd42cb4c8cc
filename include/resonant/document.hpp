#pragma once

#include <string>
#include <utility>

#include "history_ring.hpp"
#include "type_alias.hpp"
#include "vector_space.hpp"

namespace resonant {

/// Number of dense snapshots kept per document.
constexpr std::size_t HISTORY_CAPACITY = 5;

/// Document produced by the crawler (or read from disk) and handed over for ingestion.
struct CrawledDocument {
    std::string url;
    std::string title;
    std::string text;
};

/// A document in the engine's corpus with its precomputed representations.
struct IndexedDocument {
    std::string title;
    /// URL or file path.
    std::string identifier;
    std::string text;
    SparseVector vector;
    DualVector dual;
    double entropy = 0.0;
    Timestamp timestamp = 0;
    double reversibility = 1.0;
    double buffering = 0.0;
    HistoryRing<DenseVector, HISTORY_CAPACITY> history{};
};

struct SearchResult {
    std::string title;
    std::string identifier;
    std::string snippet;
    /// Dot product of the query and document vectors.
    double resonance = 0.0;
    double delta_entropy = 0.0;
    /// Standard score: resonance penalized by the entropy difference.
    double score = 0.0;
    double quantum_score = 0.0;
    double persistence_score = 0.0;
    /// Weighted combination of the above; results are ordered by it.
    double combined_score = 0.0;
};

}  // namespace resonant
