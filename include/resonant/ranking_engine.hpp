#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "configuration.hpp"
#include "document.hpp"
#include "document_channel.hpp"
#include "tokenizer.hpp"
#include "type_alias.hpp"

namespace resonant {

/// Source of the current time, in seconds since the Unix epoch.
using Clock = std::function<Timestamp()>;

[[nodiscard]] auto system_clock_now() -> Timestamp;

/// Number of characters of document text shown in a search result.
constexpr std::size_t SNIPPET_LENGTH = 200;

/// Minimum query/document dot product for a document to be affected by a feedback jump.
constexpr double JUMP_THRESHOLD = 0.1;

/**
 * Combines the partial scores according to the enabled features:
 * 50/25/25 when both quantum and persistence scoring are enabled, 70/30 when only one of them is,
 * and the standard score alone otherwise.
 */
[[nodiscard]] auto
combine_scores(EngineConfig const& config, double standard, double quantum, double persistence)
    -> double;

/// First `max_chars` UTF-8 characters of `text` with newlines replaced by spaces and surrounding
/// whitespace trimmed; `...` is appended if the text was truncated.
[[nodiscard]] auto make_snippet(std::string_view text, std::size_t max_chars = SNIPPET_LENGTH)
    -> std::string;

/**
 * Owns the document corpus and answers ranked queries.
 *
 * The vocabulary is guarded by its own mutex, so that a search (which may extend the vocabulary)
 * never races with ingestion. The corpus is guarded by a read/write lock: ingestion, relationship
 * refresh and feedback jumps are exclusive, searches are shared.
 */
class RankingEngine {
  public:
    explicit RankingEngine(EngineConfig config = {}, Clock clock = system_clock_now);

    /**
     * Tokenizes and indexes a document.
     *
     * Documents without any tokens are dropped without error; returns `false` in that case.
     */
    auto ingest(CrawledDocument document) -> bool;

    /// Ingests documents from `channel` until it is closed. Returns the number of documents
    /// accepted into the corpus.
    auto ingest_from(DocumentChannel& channel) -> std::size_t;

    /**
     * Recomputes each document's reversibility against all other documents and appends the
     * current dense projection to its history.
     *
     * This pass is quadratic in the corpus size and is never triggered automatically; call it
     * before searching to keep reversibility current.
     */
    void refresh_relationships();

    /**
     * Returns at most `k` documents ordered by combined score (descending); ties keep insertion
     * order. An empty query or an empty corpus yields no results.
     *
     * Tokenizing the query may extend the vocabulary.
     */
    [[nodiscard]] auto search(std::string_view query, std::size_t k) -> std::vector<SearchResult>;

    /**
     * Relevance feedback: every document resonating with `query` above `JUMP_THRESHOLD` moves its
     * reversibility towards `resonance * importance`, and if older than a day, has its apparent
     * age halved.
     */
    void apply_quantum_jump(std::string_view query, double importance);

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto vocabulary_size() const -> std::size_t;
    [[nodiscard]] auto config() const noexcept -> EngineConfig const&;

    /// Returns a copy of the document at `position` in insertion order.
    [[nodiscard]] auto document(std::size_t position) const -> IndexedDocument;

  private:
    [[nodiscard]] auto tokenize(std::string_view text) -> std::vector<TermId>;
    [[nodiscard]] auto age_days(IndexedDocument const& document, Timestamp now) const -> double;
    [[nodiscard]] auto quantum_score(
        SparseVector const& query, DualVector const& query_dual, IndexedDocument const& document, double age
    ) const -> double;
    [[nodiscard]] auto persistence(IndexedDocument const& document, double delta_entropy, double age) const
        -> double;

    EngineConfig m_config;
    Clock m_clock;

    mutable std::mutex m_vocabulary_mutex;
    PrimeTokenizer m_tokenizer;

    mutable std::shared_mutex m_corpus_mutex;
    std::vector<IndexedDocument> m_documents;
};

}  // namespace resonant
