#include "resonant/ranking_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <span>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "resonant/ensure.hpp"
#include "resonant/entropy.hpp"
#include "resonant/vector_space.hpp"

namespace resonant {

namespace {

    constexpr double MAX_DECAY_AGE_DAYS = 100.0;
    constexpr double DECAY_PER_DAY = 0.01;
    constexpr double JUMP_RETENTION = 0.9;

    [[nodiscard]] auto is_continuation_byte(char byte) -> bool {
        return (static_cast<unsigned char>(byte) & 0xC0U) == 0x80U;
    }

    [[nodiscard]] auto is_blank(char c) -> bool {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

}  // namespace

auto system_clock_now() -> Timestamp {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

auto combine_scores(EngineConfig const& config, double standard, double quantum, double persistence)
    -> double {
    if (config.use_quantum_score && config.use_persistence_score) {
        return 0.5 * standard + 0.25 * quantum + 0.25 * persistence;
    }
    if (config.use_quantum_score) {
        return 0.7 * standard + 0.3 * quantum;
    }
    if (config.use_persistence_score) {
        return 0.7 * standard + 0.3 * persistence;
    }
    return standard;
}

auto make_snippet(std::string_view text, std::size_t max_chars) -> std::string {
    std::size_t end = 0;
    std::size_t chars = 0;
    while (end < text.size() && chars < max_chars) {
        ++end;
        while (end < text.size() && is_continuation_byte(text[end])) {
            ++end;
        }
        ++chars;
    }
    bool truncated = end < text.size();
    std::string snippet(text.substr(0, end));
    std::replace_if(
        snippet.begin(), snippet.end(), [](char c) { return c == '\n' || c == '\r'; }, ' ');
    auto first = std::find_if_not(snippet.begin(), snippet.end(), is_blank);
    auto last = std::find_if_not(snippet.rbegin(), snippet.rend(), is_blank).base();
    snippet = first < last ? std::string(first, last) : std::string();
    if (truncated) {
        snippet += "...";
    }
    return snippet;
}

RankingEngine::RankingEngine(EngineConfig config, Clock clock)
    : m_config(std::move(config)), m_clock(std::move(clock)) {
    m_config.validate();
    ensure(static_cast<bool>(m_clock)).or_throw(std::invalid_argument("clock must be callable"));
}

auto RankingEngine::tokenize(std::string_view text) -> std::vector<TermId> {
    std::lock_guard lock(m_vocabulary_mutex);
    return m_tokenizer.tokenize(text);
}

auto RankingEngine::ingest(CrawledDocument document) -> bool {
    auto tokens = tokenize(document.text);
    if (tokens.empty()) {
        spdlog::debug("Dropping document without tokens: {}", document.url);
        return false;
    }

    IndexedDocument indexed;
    indexed.title = std::move(document.title);
    indexed.identifier = std::move(document.url);
    indexed.text = std::move(document.text);
    indexed.vector = build_vector(tokens);
    indexed.dual = build_dual_vector(tokens);
    indexed.entropy = shannon_entropy(tokens);
    indexed.timestamp = m_clock();
    indexed.reversibility = 1.0;
    auto dense = to_dense(indexed.vector, m_config.dense_dimension);
    indexed.buffering = buffering_capacity(dense);
    indexed.history.push(std::move(dense));

    std::unique_lock lock(m_corpus_mutex);
    m_documents.push_back(std::move(indexed));
    return true;
}

auto RankingEngine::ingest_from(DocumentChannel& channel) -> std::size_t {
    std::size_t accepted = 0;
    std::size_t received = 0;
    while (auto document = channel.receive()) {
        ++received;
        if (ingest(std::move(*document))) {
            ++accepted;
        }
        if (received % 100 == 0) {
            spdlog::info("Ingested {} documents ({} received)", accepted, received);
        }
    }
    spdlog::info("Channel closed: ingested {} of {} received documents", accepted, received);
    return accepted;
}

void RankingEngine::refresh_relationships() {
    std::unique_lock lock(m_corpus_mutex);
    auto start = std::chrono::steady_clock::now();

    std::vector<DenseVector> projections;
    projections.reserve(m_documents.size());
    for (auto const& document: m_documents) {
        projections.push_back(to_dense(document.vector, m_config.dense_dimension));
    }

    if (not projections.empty()) {
        auto last = projections.size() - 1;
        for (std::size_t idx = 0; idx < m_documents.size(); ++idx) {
            // Move the current projection out of the first `last` slots, so that these are exactly
            // the other documents.
            std::swap(projections[idx], projections[last]);
            m_documents[idx].reversibility = reversibility(
                projections[last], std::span<DenseVector const>(projections.data(), last)
            );
            std::swap(projections[idx], projections[last]);
            m_documents[idx].history.push(projections[idx]);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start
    );
    spdlog::debug("Refreshed relationships of {} documents in {} ms", m_documents.size(), elapsed.count());
}

auto RankingEngine::age_days(IndexedDocument const& document, Timestamp now) const -> double {
    if (now <= document.timestamp) {
        return 0.0;
    }
    return static_cast<double>(now - document.timestamp) / static_cast<double>(SECONDS_PER_DAY);
}

auto RankingEngine::quantum_score(
    SparseVector const& query, DualVector const& query_dual, IndexedDocument const& document, double age
) const -> double {
    double decay = DECAY_PER_DAY * std::min(age, MAX_DECAY_AGE_DAYS);
    auto value = resonance(query, document.vector, decay);
    return 0.6 * value.real() + 0.2 * std::abs(value.imag())
        + 0.2 * dual_score(query_dual, document.dual);
}

auto RankingEngine::persistence(IndexedDocument const& document, double delta_entropy, double age) const
    -> double {
    auto pressure = entropy_pressure(age, m_config.update_frequency, m_config.trend_decay);
    return persistence_score(document.reversibility, pressure, document.buffering, m_config.fragility)
        * std::exp(-m_config.entropy_weight * delta_entropy);
}

auto RankingEngine::search(std::string_view query, std::size_t k) -> std::vector<SearchResult> {
    auto tokens = tokenize(query);
    if (tokens.empty() || k == 0) {
        return {};
    }
    auto query_tokens = m_tokenizer.tokenize_without_update(tokens);
    auto query_vector = build_vector(query_tokens);
    auto query_dual = build_dual_vector(query_tokens);
    auto query_entropy = shannon_entropy(query_tokens);

    std::shared_lock lock(m_corpus_mutex);
    if (m_documents.empty()) {
        return {};
    }
    auto now = m_clock();

    std::vector<SearchResult> scored(m_documents.size());
    for (std::size_t idx = 0; idx < m_documents.size(); ++idx) {
        auto const& document = m_documents[idx];
        auto& result = scored[idx];
        auto age = age_days(document, now);
        result.resonance = dot_product(query_vector, document.vector);
        result.delta_entropy = std::abs(document.entropy - query_entropy);
        result.score = result.resonance - result.delta_entropy * m_config.entropy_weight;
        if (m_config.use_quantum_score) {
            result.quantum_score = quantum_score(query_vector, query_dual, document, age);
        }
        if (m_config.use_persistence_score) {
            result.persistence_score = persistence(document, result.delta_entropy, age);
        }
        result.combined_score =
            combine_scores(m_config, result.score, result.quantum_score, result.persistence_score);
    }

    std::vector<std::size_t> order(scored.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scored](auto lhs, auto rhs) {
        return scored[lhs].combined_score > scored[rhs].combined_score;
    });
    order.resize(std::min(k, order.size()));

    std::vector<SearchResult> results;
    results.reserve(order.size());
    for (auto idx: order) {
        auto const& document = m_documents[idx];
        auto& result = scored[idx];
        result.title = document.title;
        result.identifier = document.identifier;
        result.snippet = make_snippet(document.text);
        results.push_back(std::move(result));
    }
    spdlog::debug("Query '{}' matched {} of {} documents", query, results.size(), m_documents.size());
    return results;
}

void RankingEngine::apply_quantum_jump(std::string_view query, double importance) {
    auto tokens = tokenize(query);
    if (tokens.empty()) {
        return;
    }
    auto query_vector = build_vector(tokens);

    std::unique_lock lock(m_corpus_mutex);
    auto now = m_clock();
    std::size_t boosted = 0;
    for (auto& document: m_documents) {
        auto resonance = dot_product(query_vector, document.vector);
        if (resonance <= JUMP_THRESHOLD) {
            continue;
        }
        auto target = std::clamp(resonance * importance, 0.0, 1.0);
        document.reversibility =
            JUMP_RETENTION * document.reversibility + (1.0 - JUMP_RETENTION) * target;
        document.history.push(to_dense(document.vector, m_config.dense_dimension));
        if (now > document.timestamp && now - document.timestamp > SECONDS_PER_DAY) {
            document.timestamp = now - (now - document.timestamp) / 2;
        }
        ++boosted;
    }
    spdlog::debug("Quantum jump for '{}' boosted {} documents", query, boosted);
}

auto RankingEngine::size() const -> std::size_t {
    std::shared_lock lock(m_corpus_mutex);
    return m_documents.size();
}

auto RankingEngine::vocabulary_size() const -> std::size_t {
    std::lock_guard lock(m_vocabulary_mutex);
    return m_tokenizer.vocabulary().size();
}

auto RankingEngine::config() const noexcept -> EngineConfig const& {
    return m_config;
}

auto RankingEngine::document(std::size_t position) const -> IndexedDocument {
    std::shared_lock lock(m_corpus_mutex);
    ensure(position < m_documents.size())
        .or_throw_with<std::out_of_range>(
            "document position {} out of range (size {})", position, m_documents.size()
        );
    return m_documents[position];
}

}  // namespace resonant
