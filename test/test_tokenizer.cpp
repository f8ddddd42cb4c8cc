#define CATCH_CONFIG_MAIN

#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "catch2/catch.hpp"
#include <rapidcheck.h>

#include "resonant/primes.hpp"
#include "resonant/tokenizer.hpp"

using namespace resonant;

TEST_CASE("Primes") {
    SECTION("is_prime") {
        std::vector<TermId> primes;
        for (TermId n = 0; n < 50; ++n) {
            if (is_prime(n)) {
                primes.push_back(n);
            }
        }
        REQUIRE(primes == std::vector<TermId>{2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41, 43, 47});
        REQUIRE(is_prime(7919));
        REQUIRE_FALSE(is_prime(7917));
        REQUIRE_FALSE(is_prime(25));
        REQUIRE_FALSE(is_prime(49));
    }
    SECTION("next_prime is strictly greater") {
        REQUIRE(next_prime(0) == 2);
        REQUIRE(next_prime(1) == 2);
        REQUIRE(next_prime(2) == 3);
        REQUIRE(next_prime(3) == 5);
        REQUIRE(next_prime(13) == 17);
        REQUIRE(next_prime(24) == 29);
    }
}

TEST_CASE("WordTokenStream") {
    WHEN("Empty input") {
        WordTokenStream tok("");
        REQUIRE(tok.next() == std::nullopt);
    }
    WHEN("Only separators") {
        WordTokenStream tok(" \t,.;-  ");
        REQUIRE(tok.next() == std::nullopt);
    }
    WHEN("Words are lower-cased and split on punctuation") {
        WordTokenStream tok("Hello, WORLD! snake_case w0rd token-izer");
        REQUIRE(
            tok.collect()
            == std::vector<std::string>{"hello", "world", "snake_case", "w0rd", "token", "izer"}
        );
    }
    WHEN("Multi-byte characters are part of words") {
        WordTokenStream tok("caf\xc3\xa9 na\xc3\xafve");
        REQUIRE(tok.collect() == std::vector<std::string>{"caf\xc3\xa9", "na\xc3\xafve"});
    }
    SECTION("is_word_char") {
        REQUIRE(is_word_char('a'));
        REQUIRE(is_word_char('Z'));
        REQUIRE(is_word_char('5'));
        REQUIRE(is_word_char('_'));
        REQUIRE(is_word_char('\xc3'));
        REQUIRE_FALSE(is_word_char(' '));
        REQUIRE_FALSE(is_word_char('-'));
        REQUIRE_FALSE(is_word_char('\''));
    }
}

TEST_CASE("PrimeTokenizer") {
    PrimeTokenizer tokenizer;

    SECTION("Empty text yields no tokens and leaves the vocabulary untouched") {
        REQUIRE(tokenizer.tokenize("").empty());
        REQUIRE(tokenizer.tokenize("  ...  ").empty());
        REQUIRE(tokenizer.vocabulary().size() == 0);
        REQUIRE(tokenizer.current() == PrimeTokenizer::DEFAULT_SEED);
    }
    SECTION("New words get consecutive primes") {
        REQUIRE(tokenizer.tokenize("the quick brown fox") == std::vector<TermId>{3, 5, 7, 11});
        REQUIRE(tokenizer.current() == 11);
        REQUIRE(tokenizer.vocabulary().size() == 4);
    }
    SECTION("Known words keep their IDs across calls and case") {
        auto first = tokenizer.tokenize("the cat sat on the mat");
        REQUIRE(first == std::vector<TermId>{3, 5, 7, 11, 3, 13});
        auto second = tokenizer.tokenize("THE Mat dog");
        REQUIRE(second == std::vector<TermId>{3, 13, 17});
        REQUIRE(tokenizer.vocabulary().size() == 6);
    }
    SECTION("Vocabulary maps both ways") {
        std::ignore = tokenizer.tokenize("alpha beta");
        auto const& vocabulary = tokenizer.vocabulary();
        REQUIRE(vocabulary.find("alpha") == std::optional<TermId>(3));
        REQUIRE(vocabulary.find("beta") == std::optional<TermId>(5));
        REQUIRE(vocabulary.find("gamma") == std::nullopt);
        REQUIRE(vocabulary.word(5) == std::optional<std::string_view>("beta"));
        REQUIRE(vocabulary.word(7) == std::nullopt);
    }
    SECTION("tokenize_without_update passes IDs through") {
        auto ids = tokenizer.tokenize("one two one");
        auto size = tokenizer.vocabulary().size();
        REQUIRE(tokenizer.tokenize_without_update(ids) == ids);
        REQUIRE(tokenizer.vocabulary().size() == size);
    }
    SECTION("Custom seed") {
        PrimeTokenizer seeded(100);
        REQUIRE(seeded.tokenize("x y") == std::vector<TermId>{101, 103});
    }
}

TEST_CASE("Every distinct word gets a distinct prime", "[tokenizer][prop]") {
    rc::check([](std::vector<std::string> const& words) {
        PrimeTokenizer tokenizer;
        std::string text;
        for (auto const& word: words) {
            text += word;
            text += ' ';
        }
        auto ids = tokenizer.tokenize(text);
        std::set<TermId> distinct(ids.begin(), ids.end());
        REQUIRE(distinct.size() == tokenizer.vocabulary().size());
        for (auto id: distinct) {
            REQUIRE(is_prime(id));
        }
        REQUIRE(tokenizer.tokenize(text) == ids);
    });
}
