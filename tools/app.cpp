#include "app.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "resonant/ensure.hpp"

namespace resonant::arg {

Scoring::Scoring(CLI::App* app) {
    apply_environment(m_config);
    app->add_flag("--no-quantum", m_no_quantum, "Disable the quantum (resonance) score");
    app->add_flag("--no-persistence", m_no_persistence, "Disable the persistence score");
    app->add_option("--entropy-weight", m_config.entropy_weight, "Weight of the entropy difference")
        ->capture_default_str();
    app->add_option("--fragility", m_config.fragility, "Fragility of documents under entropy pressure")
        ->capture_default_str();
    app->add_option("--trend-decay", m_config.trend_decay, "Decay of the entropy trend")
        ->capture_default_str();
    app->add_option("--update-frequency", m_config.update_frequency, "Assumed update frequency")
        ->capture_default_str();
    app->add_option(
           "--dense-dimension", m_config.dense_dimension, "Number of coordinates of dense projections"
    )
        ->capture_default_str();
}

auto Scoring::engine_config() const -> EngineConfig {
    auto config = m_config;
    config.use_quantum_score = not m_no_quantum;
    config.use_persistence_score = not m_no_persistence;
    config.validate();
    return config;
}

Crawl::Crawl(CLI::App* app) {
    apply_environment(m_config);
    m_crawl_delay_ms = m_config.crawl_delay.count();
    app->add_option("--max-pages", m_config.max_pages, "Maximum number of documents to crawl")
        ->capture_default_str();
    app->add_option("--max-depth", m_config.max_depth, "Maximum link depth from the seeds")
        ->capture_default_str();
    app->add_option("--crawl-delay", m_crawl_delay_ms, "Delay between requests to one host [ms]")
        ->capture_default_str();
    app->add_flag("--ignore-noindex", m_ignore_noindex, "Index pages marked noindex");
    app->add_flag("--ignore-nofollow", m_ignore_nofollow, "Follow links marked nofollow");
    app->add_option("--allowed-domain", m_allowed_domains, "Only crawl these hosts");
    app->add_option(
           "--max-concurrent-requests",
           m_config.max_concurrent_requests,
           "Maximum number of requests in flight"
    )
        ->capture_default_str();
    app->add_option("--workers", m_config.workers, "Number of crawler workers")->capture_default_str();
    app->add_option("--user-agent", m_config.user_agent, "User agent string")->capture_default_str();
    app->add_option(
           "--channel-capacity", m_config.channel_capacity, "Documents buffered before crawling blocks"
    )
        ->capture_default_str();
}

auto Crawl::crawler_config() const -> CrawlerConfig {
    auto config = m_config;
    config.crawl_delay = std::chrono::milliseconds(m_crawl_delay_ms);
    config.respect_noindex = not m_ignore_noindex;
    config.respect_nofollow = not m_ignore_nofollow;
    for (auto const& domain: m_allowed_domains) {
        config.allowed_domains.insert(boost::algorithm::to_lower_copy(domain));
    }
    config.validate();
    return config;
}

Sources::Sources(CLI::App* app) {
    app->add_option("--seed", m_seeds, "Seed URL to crawl from");
    app->add_option("--seeds-file", m_seeds_file, "File with one seed URL per line")
        ->check(CLI::ExistingFile);
    app->add_option("--directory", m_directory, "Directory of .txt and .html files to index")
        ->check(CLI::ExistingDirectory);
}

auto Sources::seeds() const -> std::vector<std::string> {
    auto seeds = m_seeds;
    if (m_seeds_file) {
        std::ifstream is(*m_seeds_file);
        ensure(is.is_open()).or_throw_with<std::runtime_error>("Unable to open seeds file {}", *m_seeds_file);
        std::string line;
        while (std::getline(is, line)) {
            boost::algorithm::trim(line);
            if (not line.empty() && not line.starts_with('#')) {
                seeds.push_back(line);
            }
        }
    }
    return seeds;
}

auto Sources::directory() const -> std::optional<std::string> const& {
    return m_directory;
}

Search::Search(CLI::App* app) {
    app->add_option("-k", m_k, "The number of top results to return")->capture_default_str();
    app->add_option(
           "--jump-importance", m_jump_importance, "Importance of the feedback applied after each query"
    )
        ->capture_default_str();
}

LogLevel::LogLevel(CLI::App* app) {
    app->add_option("-L,--log-level", m_level, "Log level")
        ->capture_default_str()
        ->check(CLI::IsMember(VALID_LEVELS));
}

auto LogLevel::log_level() const -> spdlog::level::level_enum {
    return ENUM_MAP.at(m_level);
}

const std::set<std::string> LogLevel::VALID_LEVELS = {
    "trace", "debug", "info", "warn", "err", "critical", "off"
};
const std::map<std::string, spdlog::level::level_enum> LogLevel::ENUM_MAP = {
    {"trace", spdlog::level::level_enum::trace},
    {"debug", spdlog::level::level_enum::debug},
    {"info", spdlog::level::level_enum::info},
    {"warn", spdlog::level::level_enum::warn},
    {"err", spdlog::level::level_enum::err},
    {"critical", spdlog::level::level_enum::critical},
    {"off", spdlog::level::level_enum::off}
};

}  // namespace resonant::arg
