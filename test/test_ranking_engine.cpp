#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include <cmath>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <rapidcheck.h>

#include "resonant/ranking_engine.hpp"

using namespace resonant;

namespace {

constexpr Timestamp START = 1'600'000'000;

auto standard_only() -> EngineConfig {
    EngineConfig config;
    config.use_quantum_score = false;
    config.use_persistence_score = false;
    return config;
}

auto document(std::string url, std::string text) -> CrawledDocument {
    return CrawledDocument{url, "Title of " + url, std::move(text)};
}

void ingest_fruit(RankingEngine& engine) {
    REQUIRE(engine.ingest(document("a", "apple banana apple")));
    REQUIRE(engine.ingest(document("b", "banana cherry")));
    REQUIRE(engine.ingest(document("c", "cherry date elder fig")));
}

}  // namespace

TEST_CASE("combine_scores") {
    EngineConfig config;
    SECTION("Both extra scores") {
        REQUIRE(combine_scores(config, 1.0, 2.0, 4.0) == Approx(0.5 + 0.5 + 1.0));
    }
    SECTION("Quantum only") {
        config.use_persistence_score = false;
        REQUIRE(combine_scores(config, 1.0, 2.0, 4.0) == Approx(0.7 + 0.6));
    }
    SECTION("Persistence only") {
        config.use_quantum_score = false;
        REQUIRE(combine_scores(config, 1.0, 2.0, 4.0) == Approx(0.7 + 1.2));
    }
    SECTION("Standard only") {
        REQUIRE(combine_scores(standard_only(), 1.0, 2.0, 4.0) == 1.0);
    }
}

TEST_CASE("make_snippet") {
    SECTION("Short text is kept") {
        REQUIRE(make_snippet("short text") == "short text");
        REQUIRE(make_snippet("") == "");
    }
    SECTION("Newlines become spaces and surrounding whitespace is trimmed") {
        REQUIRE(make_snippet("  first\nsecond\r\nthird \n") == "first second  third");
    }
    SECTION("Long text is truncated with an ellipsis") {
        std::string text(250, 'a');
        REQUIRE(make_snippet(text) == std::string(SNIPPET_LENGTH, 'a') + "...");
        REQUIRE(make_snippet(std::string(SNIPPET_LENGTH, 'a')) == std::string(SNIPPET_LENGTH, 'a'));
    }
    SECTION("Multi-byte characters are never split") {
        std::string text;
        for (int i = 0; i < 201; ++i) {
            text += "\xc3\xa9";
        }
        auto snippet = make_snippet(text);
        REQUIRE(snippet.size() == 2 * SNIPPET_LENGTH + 3);
        REQUIRE(snippet.substr(snippet.size() - 5) == "\xc3\xa9...");
    }
}

TEST_CASE("Ingest") {
    Timestamp now = START;
    RankingEngine engine(EngineConfig{}, [&now] { return now; });

    SECTION("Documents without tokens are silently dropped") {
        REQUIRE_FALSE(engine.ingest(document("empty", "")));
        REQUIRE_FALSE(engine.ingest(document("punctuation", " ... !!! ---")));
        REQUIRE(engine.size() == 0);
        REQUIRE(engine.ingest(document("real", "some words")));
        REQUIRE(engine.size() == 1);
    }
    SECTION("Indexed document state") {
        REQUIRE(engine.ingest(document("a", "apple banana apple")));
        auto indexed = engine.document(0);
        REQUIRE(indexed.identifier == "a");
        REQUIRE(indexed.title == "Title of a");
        REQUIRE(indexed.timestamp == START);
        REQUIRE(indexed.reversibility == 1.0);
        REQUIRE(indexed.entropy == Approx(-(2.0 / 3 * std::log2(2.0 / 3) + 1.0 / 3 * std::log2(1.0 / 3))));
        REQUIRE(indexed.vector.at(3) == Approx(2.0 / 3));
        REQUIRE(indexed.history.size() == 1);
        REQUIRE(indexed.buffering > 0.0);
        REQUIRE(engine.vocabulary_size() == 2);
        REQUIRE_THROWS_AS(engine.document(1), std::out_of_range);
    }
    SECTION("Consuming a channel until it is closed") {
        DocumentChannel channel(2);
        std::thread producer([&channel] {
            for (int i = 0; i < 5; ++i) {
                channel.send(document(std::to_string(i), "text number " + std::to_string(i)));
            }
            channel.send(document("empty", ""));
            channel.close();
        });
        auto accepted = engine.ingest_from(channel);
        producer.join();
        REQUIRE(accepted == 5);
        REQUIRE(engine.size() == 5);
    }
}

TEST_CASE("Search") {
    Timestamp now = START;

    SECTION("Standard score ranks by resonance penalized by entropy difference") {
        RankingEngine engine(standard_only(), [&now] { return now; });
        ingest_fruit(engine);
        auto results = engine.search("apple banana", 10);
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].identifier == "a");
        REQUIRE(results[1].identifier == "b");
        REQUIRE(results[2].identifier == "c");

        double entropy_a = -(2.0 / 3 * std::log2(2.0 / 3) + 1.0 / 3 * std::log2(1.0 / 3));
        // query: {apple: 1/2, banana: 1/2}, entropy 1
        REQUIRE(results[0].resonance == Approx(0.5));
        REQUIRE(results[0].delta_entropy == Approx(1.0 - entropy_a));
        REQUIRE(results[0].score == Approx(0.5 - (1.0 - entropy_a) * 0.1));
        REQUIRE(results[1].score == Approx(0.25));
        REQUIRE(results[2].score == Approx(-0.1));
        for (auto const& result: results) {
            REQUIRE(result.combined_score == result.score);
            REQUIRE(result.quantum_score == 0.0);
            REQUIRE(result.persistence_score == 0.0);
        }
        REQUIRE(results[0].title == "Title of a");
        REQUIRE(results[0].snippet == "apple banana apple");
    }
    SECTION("Empty query or corpus yields nothing") {
        RankingEngine engine(EngineConfig{}, [&now] { return now; });
        REQUIRE(engine.search("apple", 10).empty());
        ingest_fruit(engine);
        REQUIRE(engine.search("", 10).empty());
        REQUIRE(engine.search("  ?! ", 10).empty());
        REQUIRE(engine.search("apple", 0).empty());
    }
    SECTION("At most k results, ordered by combined score") {
        RankingEngine engine(EngineConfig{}, [&now] { return now; });
        ingest_fruit(engine);
        REQUIRE(engine.ingest(document("d", "apple apple apple cherry")));
        engine.refresh_relationships();
        now += 3 * SECONDS_PER_DAY;

        auto results = engine.search("apple cherry", 2);
        REQUIRE(results.size() == 2);
        auto all = engine.search("apple cherry", 100);
        REQUIRE(all.size() == 4);
        for (std::size_t idx = 1; idx < all.size(); ++idx) {
            REQUIRE(all[idx - 1].combined_score >= all[idx].combined_score);
        }
        for (auto const& result: all) {
            REQUIRE(result.persistence_score >= 0.0);
            REQUIRE(result.persistence_score <= 1.0);
            REQUIRE(
                result.combined_score
                == Approx(0.5 * result.score + 0.25 * result.quantum_score + 0.25 * result.persistence_score)
            );
        }
    }
    SECTION("Documents older than the pressure can represent") {
        RankingEngine engine(EngineConfig{}, [&now] { return now; });
        ingest_fruit(engine);
        now += 720 * SECONDS_PER_DAY;

        auto results = engine.search("apple", 3);
        REQUIRE(results.size() == 3);
        for (std::size_t idx = 0; idx < results.size(); ++idx) {
            REQUIRE(std::isfinite(results[idx].persistence_score));
            REQUIRE(std::isfinite(results[idx].combined_score));
            REQUIRE(results[idx].persistence_score <= 1.0);
            if (idx > 0) {
                REQUIRE(results[idx - 1].combined_score >= results[idx].combined_score);
            }
        }
        // Never compared with other documents, so fully reversible.
        REQUIRE(results[0].identifier == "a");
        REQUIRE(results[0].persistence_score > 0.0);

        engine.refresh_relationships();
        for (auto const& result: engine.search("apple banana cherry", 3)) {
            REQUIRE(std::isfinite(result.combined_score));
            REQUIRE(result.persistence_score >= 0.0);
        }
    }
    SECTION("Ties keep insertion order") {
        RankingEngine engine(standard_only(), [&now] { return now; });
        REQUIRE(engine.ingest(document("first", "same words")));
        REQUIRE(engine.ingest(document("second", "same words")));
        REQUIRE(engine.ingest(document("third", "same words")));
        auto results = engine.search("same", 3);
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].identifier == "first");
        REQUIRE(results[1].identifier == "second");
        REQUIRE(results[2].identifier == "third");
    }
    SECTION("Query words extend the vocabulary") {
        RankingEngine engine(EngineConfig{}, [&now] { return now; });
        ingest_fruit(engine);
        auto before = engine.vocabulary_size();
        std::ignore = engine.search("unseen", 5);
        REQUIRE(engine.vocabulary_size() == before + 1);
    }
}

TEST_CASE("Refresh relationships") {
    Timestamp now = START;
    RankingEngine engine(EngineConfig{}, [&now] { return now; });

    SECTION("A single document has nothing to relate to") {
        REQUIRE(engine.ingest(document("a", "apple banana")));
        engine.refresh_relationships();
        auto indexed = engine.document(0);
        REQUIRE(indexed.reversibility == 1.0);
        REQUIRE(indexed.history.size() == 2);
    }
    SECTION("Reversibility stays in [0, 1] and history is bounded") {
        ingest_fruit(engine);
        for (std::size_t round = 0; round < HISTORY_CAPACITY + 2; ++round) {
            engine.refresh_relationships();
        }
        for (std::size_t idx = 0; idx < engine.size(); ++idx) {
            auto indexed = engine.document(idx);
            REQUIRE(indexed.reversibility >= 0.0);
            REQUIRE(indexed.reversibility <= 1.0);
            REQUIRE(indexed.history.size() == HISTORY_CAPACITY);
        }
    }
}

TEST_CASE("Quantum jump") {
    Timestamp now = START;
    RankingEngine engine(EngineConfig{}, [&now] { return now; });
    ingest_fruit(engine);

    SECTION("Resonating documents move towards the feedback") {
        engine.apply_quantum_jump("apple banana", 0.2);
        // dot products: a = 0.5, b = 0.25, c = 0
        REQUIRE(engine.document(0).reversibility == Approx(0.9 + 0.1 * 0.1));
        REQUIRE(engine.document(1).reversibility == Approx(0.9 + 0.1 * 0.05));
        auto untouched = engine.document(2);
        REQUIRE(untouched.reversibility == 1.0);
        REQUIRE(untouched.history.size() == 1);
    }
    SECTION("Old documents get younger, recent ones do not") {
        now = START + 10 * SECONDS_PER_DAY;
        engine.apply_quantum_jump("apple banana", 0.2);
        REQUIRE(engine.document(0).timestamp == START + 5 * SECONDS_PER_DAY);
        REQUIRE(engine.document(2).timestamp == START);

        REQUIRE(engine.ingest(document("fresh", "apple banana kiwi")));
        now += SECONDS_PER_DAY / 2;
        engine.apply_quantum_jump("apple banana", 0.2);
        REQUIRE(engine.document(3).timestamp == START + 10 * SECONDS_PER_DAY);
    }
    SECTION("Below the threshold nothing changes") {
        engine.apply_quantum_jump("fig", 1.0);
        // dot(c, fig) = 0.25 * 1.0 > 0.1, the others do not contain fig
        REQUIRE(engine.document(0).reversibility == 1.0);
        REQUIRE(engine.document(1).reversibility == 1.0);
        REQUIRE(engine.document(2).reversibility == Approx(0.9 + 0.1 * 0.25));
        engine.apply_quantum_jump("elder kiwi mango plum", 1.0);
        // dot(c, query) = 0.25 * 0.25, at most the threshold
        REQUIRE(engine.document(2).reversibility == Approx(0.9 + 0.1 * 0.25));
    }
}

TEST_CASE("Quantum jump bounds", "[ranking_engine][prop]") {
    rc::check([] {
        static const std::vector<std::string> vocabulary{"alpha", "beta", "gamma", "delta", "omega"};
        auto mask = *rc::gen::inRange(0, 32);
        auto importance = *rc::gen::arbitrary<double>();
        RC_PRE(std::isfinite(importance));

        Timestamp now = START;
        RankingEngine engine(EngineConfig{}, [&now] { return now; });
        REQUIRE(engine.ingest(document("a", "alpha beta gamma")));
        REQUIRE(engine.ingest(document("b", "delta omega")));
        engine.refresh_relationships();

        std::string query;
        for (std::size_t idx = 0; idx < vocabulary.size(); ++idx) {
            if ((mask & (1 << idx)) != 0) {
                query += vocabulary[idx] + " ";
            }
        }
        std::vector<double> before{engine.document(0).reversibility, engine.document(1).reversibility};
        engine.apply_quantum_jump(query, importance);
        for (std::size_t idx = 0; idx < before.size(); ++idx) {
            auto after = engine.document(idx).reversibility;
            REQUIRE(after >= 0.9 * before[idx] - 1e-12);
            REQUIRE(after <= 0.9 * before[idx] + 0.1 + 1e-12);
            REQUIRE(after >= 0.0);
            REQUIRE(after <= 1.0);
        }
    });
}
