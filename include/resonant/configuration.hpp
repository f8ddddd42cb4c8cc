#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

namespace resonant {

/// Scoring parameters and feature toggles of the ranking engine.
struct EngineConfig {
    bool use_quantum_score = true;
    bool use_persistence_score = true;
    double entropy_weight = 0.1;
    double fragility = 0.2;
    double trend_decay = 0.05;
    double update_frequency = 0.1;
    /// Number of coordinates of dense projections; term IDs at or above it are dropped.
    std::size_t dense_dimension = 4096;

    /// Throws `std::invalid_argument` if any parameter is out of range.
    void validate() const;
};

struct CrawlerConfig {
    std::size_t max_pages = 1000;
    std::uint32_t max_depth = 3;
    /// Base delay between two requests to the same host; jittered by +/-20%.
    std::chrono::milliseconds crawl_delay{500};
    bool respect_noindex = true;
    bool respect_nofollow = true;
    /// Hosts allowed to be crawled; empty means no restriction.
    std::unordered_set<std::string> allowed_domains{};
    std::size_t max_concurrent_requests = 10;
    std::size_t workers = 10;
    std::string user_agent = "ResonantSearch/1.0";
    std::chrono::seconds robots_ttl{24 * 3600};
    std::size_t channel_capacity = 500;
    /// Sleep between the two empty-frontier checks before a worker gives up.
    std::chrono::milliseconds idle_grace{100};

    /// Throws `std::invalid_argument` if any parameter is out of range.
    void validate() const;
};

/// Overrides fields of `config` with `RESONANT_*` environment variables, if set.
void apply_environment(EngineConfig& config);

/// Overrides fields of `config` with `RESONANT_*` environment variables, if set.
void apply_environment(CrawlerConfig& config);

}  // namespace resonant
