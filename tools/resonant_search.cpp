#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tbb/global_control.h>

#include "app.hpp"
#include "resonant/crawl/crawler.hpp"
#include "resonant/crawl/http_client.hpp"
#include "resonant/document_channel.hpp"
#include "resonant/local_collection.hpp"
#include "resonant/ranking_engine.hpp"

using namespace resonant;

namespace {

void crawl_into(RankingEngine& engine, CrawlerConfig const& config, std::vector<std::string> const& seeds) {
    tbb::global_control control(tbb::global_control::max_allowed_parallelism, config.workers + 1);
    spdlog::info("Crawling from {} seeds with {} workers", seeds.size(), config.workers);

    crawl::BeastHttpClient client(config.user_agent);
    DocumentChannel channel(config.channel_capacity);
    crawl::Crawler crawler(config, client, channel);

    std::exception_ptr crawl_error = nullptr;
    std::thread crawl_thread([&] {
        try {
            crawler.crawl(seeds);
        } catch (...) {
            crawl_error = std::current_exception();
        }
    });
    engine.ingest_from(channel);
    crawl_thread.join();
    if (crawl_error) {
        std::rethrow_exception(crawl_error);
    }
}

void print_results(std::vector<SearchResult> const& results) {
    if (results.empty()) {
        std::cout << "No results.\n";
        return;
    }
    for (std::size_t rank = 0; rank < results.size(); ++rank) {
        auto const& result = results[rank];
        std::cout << fmt::format(
            "{}. {}\n   {}\n   score: {:.4f} (standard {:.4f}, quantum {:.4f}, persistence {:.4f}, "
            "resonance {:.4f}, delta entropy {:.4f})\n   {}\n",
            rank + 1,
            result.title,
            result.identifier,
            result.combined_score,
            result.score,
            result.quantum_score,
            result.persistence_score,
            result.resonance,
            result.delta_entropy,
            result.snippet
        );
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        App<arg::Sources, arg::Scoring, arg::Crawl, arg::Search, arg::LogLevel> app{
            "resonant_search - crawl or load documents, then answer queries read from standard input."
        };
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(app.log_level());

        auto seeds = app.seeds();
        if (seeds.empty() && not app.directory()) {
            spdlog::error("Nothing to index: pass --seed, --seeds-file, or --directory");
            return EXIT_FAILURE;
        }

        RankingEngine engine(app.engine_config());
        if (app.directory()) {
            load_directory(*app.directory(), engine);
        }
        if (not seeds.empty()) {
            crawl_into(engine, app.crawler_config(), seeds);
        }

        spdlog::info("Refreshing relationships between {} documents", engine.size());
        engine.refresh_relationships();
        spdlog::info("Indexed {} documents with {} distinct terms", engine.size(), engine.vocabulary_size());

        std::string query;
        while (std::getline(std::cin, query)) {
            boost::algorithm::trim(query);
            if (query.empty()) {
                continue;
            }
            print_results(engine.search(query, app.k()));
            if (app.jump_importance() > 0.0) {
                engine.apply_quantum_jump(query, app.jump_importance());
            }
        }
    } catch (std::exception const& err) {
        spdlog::error("{}", err.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
