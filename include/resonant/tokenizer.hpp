#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "type_alias.hpp"

namespace resonant {

/**
 * Splits text into lower-cased words.
 *
 * A word is a maximal run of ASCII letters, digits, underscores, and bytes with the high bit set,
 * so that UTF-8 encoded words are never cut in the middle. Everything else separates words.
 */
class WordTokenStream {
    std::string_view m_view;

  public:
    explicit WordTokenStream(std::string_view input);

    /**
     * Returns the next word or `std::nullopt` if no more words are available.
     */
    auto next() -> std::optional<std::string>;

    /** Collects all remaining words into a vector. */
    [[nodiscard]] auto collect() -> std::vector<std::string>;
};

[[nodiscard]] auto is_word_char(char symbol) noexcept -> bool;

/**
 * Bidirectional word <-> term ID mapping.
 *
 * IDs are handed out by `insert` and are never reassigned; the vocabulary never shrinks.
 */
class Vocabulary {
    std::unordered_map<std::string, TermId> m_ids;
    std::unordered_map<TermId, std::string> m_words;

  public:
    [[nodiscard]] auto find(std::string_view word) const -> std::optional<TermId>;
    [[nodiscard]] auto word(TermId id) const -> std::optional<std::string_view>;
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    void insert(std::string word, TermId id);
};

/**
 * Tokenizer assigning every distinct word a prime number.
 *
 * The first occurrence of a word allocates the next prime strictly greater than the current
 * counter; later occurrences reuse the same ID. An instance exclusively owns its vocabulary and is
 * not synchronized: concurrent callers must serialize through a single owner.
 */
class PrimeTokenizer {
    Vocabulary m_vocabulary;
    TermId m_current;

  public:
    static constexpr TermId DEFAULT_SEED = 2;

    explicit PrimeTokenizer(TermId seed = DEFAULT_SEED);

    /// Tokenizes `text`, extending the vocabulary with unseen words.
    [[nodiscard]] auto tokenize(std::string_view text) -> std::vector<TermId>;

    /// Passes already known IDs through without touching the vocabulary.
    [[nodiscard]] auto tokenize_without_update(std::vector<TermId> const& ids) const
        -> std::vector<TermId>;

    [[nodiscard]] auto vocabulary() const noexcept -> Vocabulary const&;
    [[nodiscard]] auto current() const noexcept -> TermId;
};

}  // namespace resonant
