#pragma once

#include <atomic>
#include <cstddef>
#include <semaphore>
#include <string>
#include <vector>

#include "resonant/configuration.hpp"
#include "resonant/document_channel.hpp"
#include "frontier.hpp"
#include "http_client.hpp"
#include "rate_limiter.hpp"
#include "robots.hpp"

namespace resonant::crawl {

/// Decorator bounding the number of requests in flight through the wrapped client.
class ConcurrencyLimitedClient: public HttpClient {
  public:
    ConcurrencyLimitedClient(HttpClient& client, std::size_t max_in_flight);

    [[nodiscard]] auto get(Url const& url) -> HttpResponse override;

  private:
    HttpClient& m_client;
    std::counting_semaphore<> m_permits;
};

struct CrawlStats {
    /// Pages fetched successfully, whatever their status code.
    std::size_t fetched = 0;
    /// Documents sent to the channel.
    std::size_t emitted = 0;
    /// URLs abandoned for policy reasons: domain, robots.txt, status, content type, or noindex.
    std::size_t skipped = 0;
    /// URLs abandoned because of an error.
    std::size_t failed = 0;
};

/**
 * Breadth-first, polite web crawler.
 *
 * A fixed number of workers share a single frontier. Each URL is claimed as visited before it is
 * fetched, checked against robots.txt, and fetched only after the per-host rate limiter lets it
 * through. Parsed pages are sent to the document channel, which blocks when the consumer falls
 * behind.
 */
class Crawler {
  public:
    Crawler(CrawlerConfig config, HttpClient& client, DocumentChannel& channel);

    /**
     * Crawls starting from `seeds` until `max_pages` documents were emitted, the frontier is
     * exhausted, or `stop` is called. Closes the channel before returning.
     *
     * Seeds that are not valid HTTP(S) URLs are logged and ignored.
     */
    auto crawl(std::vector<std::string> const& seeds) -> CrawlStats;

    /// Requests the workers to finish after their current URL.
    void stop() noexcept;

    [[nodiscard]] auto config() const noexcept -> CrawlerConfig const& { return m_config; }

  private:
    void work(std::size_t worker);
    void process(FrontierEntry const& entry);
    [[nodiscard]] auto is_allowed_domain(Url const& url) const -> bool;
    [[nodiscard]] auto reserve_slot() -> bool;
    [[nodiscard]] auto finished() const -> bool;

    CrawlerConfig m_config;
    ConcurrencyLimitedClient m_client;
    DocumentChannel& m_channel;
    Frontier m_frontier;
    RobotsCache m_robots;
    HostRateLimiter m_rate_limiter;

    std::atomic_bool m_stop = false;
    std::atomic_size_t m_in_flight = 0;
    std::atomic_size_t m_fetched = 0;
    std::atomic_size_t m_emitted = 0;
    std::atomic_size_t m_skipped = 0;
    std::atomic_size_t m_failed = 0;
};

}  // namespace resonant::crawl
