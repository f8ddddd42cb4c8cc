#include "resonant/tokenizer.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>

#include "resonant/primes.hpp"

namespace resonant {

auto is_word_char(char symbol) noexcept -> bool {
    auto byte = static_cast<unsigned char>(symbol);
    return byte >= 0x80 || std::isalnum(byte) != 0 || symbol == '_';
}

WordTokenStream::WordTokenStream(std::string_view input) : m_view(input) {}

auto WordTokenStream::next() -> std::optional<std::string> {
    auto pos = std::find_if(m_view.begin(), m_view.end(), is_word_char);
    m_view = m_view.substr(std::distance(m_view.begin(), pos));
    if (m_view.empty()) {
        return std::nullopt;
    }
    pos = std::find_if_not(m_view.begin(), m_view.end(), is_word_char);
    auto word = std::string(m_view.substr(0, std::distance(m_view.begin(), pos)));
    m_view = m_view.substr(std::distance(m_view.begin(), pos));
    boost::algorithm::to_lower(word);
    return word;
}

auto WordTokenStream::collect() -> std::vector<std::string> {
    std::vector<std::string> words;
    while (auto word = next()) {
        words.push_back(std::move(*word));
    }
    return words;
}

auto Vocabulary::find(std::string_view word) const -> std::optional<TermId> {
    if (auto pos = m_ids.find(std::string(word)); pos != m_ids.end()) {
        return pos->second;
    }
    return std::nullopt;
}

auto Vocabulary::word(TermId id) const -> std::optional<std::string_view> {
    if (auto pos = m_words.find(id); pos != m_words.end()) {
        return std::string_view(pos->second);
    }
    return std::nullopt;
}

auto Vocabulary::size() const noexcept -> std::size_t {
    return m_ids.size();
}

void Vocabulary::insert(std::string word, TermId id) {
    m_words.emplace(id, word);
    m_ids.emplace(std::move(word), id);
}

PrimeTokenizer::PrimeTokenizer(TermId seed) : m_current(seed) {}

auto PrimeTokenizer::tokenize(std::string_view text) -> std::vector<TermId> {
    std::vector<TermId> ids;
    WordTokenStream words(text);
    while (auto word = words.next()) {
        if (auto id = m_vocabulary.find(*word); id) {
            ids.push_back(*id);
            continue;
        }
        m_current = next_prime(m_current);
        m_vocabulary.insert(std::move(*word), m_current);
        ids.push_back(m_current);
    }
    return ids;
}

auto PrimeTokenizer::tokenize_without_update(std::vector<TermId> const& ids) const
    -> std::vector<TermId> {
    return ids;
}

auto PrimeTokenizer::vocabulary() const noexcept -> Vocabulary const& {
    return m_vocabulary;
}

auto PrimeTokenizer::current() const noexcept -> TermId {
    return m_current;
}

}  // namespace resonant
