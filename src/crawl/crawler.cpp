#include "resonant/crawl/crawler.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>
#include <tbb/task_group.h>

#include "resonant/parsing/html.hpp"

namespace resonant::crawl {

namespace {

    constexpr std::size_t PROGRESS_INTERVAL = 10;

    [[nodiscard]] auto validated(CrawlerConfig config) -> CrawlerConfig {
        config.validate();
        return config;
    }

    class PermitGuard {
      public:
        explicit PermitGuard(std::counting_semaphore<>& semaphore) : m_semaphore(semaphore) {
            m_semaphore.acquire();
        }
        PermitGuard(PermitGuard const&) = delete;
        PermitGuard(PermitGuard&&) = delete;
        PermitGuard& operator=(PermitGuard const&) = delete;
        PermitGuard& operator=(PermitGuard&&) = delete;
        ~PermitGuard() { m_semaphore.release(); }

      private:
        std::counting_semaphore<>& m_semaphore;
    };

}  // namespace

ConcurrencyLimitedClient::ConcurrencyLimitedClient(HttpClient& client, std::size_t max_in_flight)
    : m_client(client), m_permits(static_cast<std::ptrdiff_t>(max_in_flight)) {}

auto ConcurrencyLimitedClient::get(Url const& url) -> HttpResponse {
    PermitGuard permit(m_permits);
    return m_client.get(url);
}

Crawler::Crawler(CrawlerConfig config, HttpClient& client, DocumentChannel& channel)
    : m_config(validated(std::move(config))),
      m_client(client, m_config.max_concurrent_requests),
      m_channel(channel),
      m_robots(m_client, m_config.user_agent, m_config.robots_ttl),
      m_rate_limiter(m_config.crawl_delay) {}

void Crawler::stop() noexcept {
    m_stop.store(true);
}

auto Crawler::finished() const -> bool {
    return m_stop.load() || m_emitted.load() >= m_config.max_pages;
}

auto Crawler::is_allowed_domain(Url const& url) const -> bool {
    return m_config.allowed_domains.empty()
        || m_config.allowed_domains.find(url.host()) != m_config.allowed_domains.end();
}

auto Crawler::reserve_slot() -> bool {
    auto emitted = m_emitted.load();
    do {
        if (emitted >= m_config.max_pages) {
            return false;
        }
    } while (not m_emitted.compare_exchange_weak(emitted, emitted + 1));
    if ((emitted + 1) % PROGRESS_INTERVAL == 0) {
        spdlog::info("Crawled {} pages", emitted + 1);
    }
    return true;
}

void Crawler::process(FrontierEntry const& entry) {
    auto const& url = entry.url;
    if (not is_allowed_domain(url)) {
        ++m_skipped;
        spdlog::debug("Skipping {}: domain not allowed", url.to_string());
        return;
    }
    if (not m_frontier.mark_visited(url)) {
        return;
    }
    if (not m_robots.allows(url)) {
        ++m_skipped;
        spdlog::debug("Skipping {}: disallowed by robots.txt", url.to_string());
        return;
    }

    m_rate_limiter.wait(url.host());
    auto response = m_client.get(url);
    ++m_fetched;
    if (not response.is_success()) {
        ++m_skipped;
        spdlog::debug("Skipping {}: status {}", url.to_string(), response.status);
        return;
    }
    if (not response.is_html()) {
        ++m_skipped;
        spdlog::debug("Skipping {}: content type '{}'", url.to_string(), response.content_type);
        return;
    }

    auto page = parsing::html::parse_page(response.body);
    if (m_config.respect_noindex && page.noindex) {
        ++m_skipped;
        spdlog::debug("Not indexing {}: noindex", url.to_string());
    } else if (reserve_slot()) {
        auto identifier = url.to_string();
        auto title = page.title.value_or(identifier);
        m_channel.send(CrawledDocument{std::move(identifier), std::move(title), std::move(page.text)});
    }

    if (entry.depth >= m_config.max_depth || (m_config.respect_nofollow && page.nofollow)) {
        return;
    }
    auto base = response.final_url;
    if (page.base_href) {
        if (auto base_href = response.final_url.resolve(*page.base_href); base_href) {
            base = *base_href;
        }
    }
    for (auto const& link: page.links) {
        if (m_config.respect_nofollow && link.nofollow) {
            continue;
        }
        if (auto target = base.resolve(link.href); target && is_allowed_domain(*target)) {
            m_frontier.push(std::move(*target), entry.depth + 1);
        }
    }
}

void Crawler::work(std::size_t worker) {
    spdlog::debug("Worker {} started", worker);
    while (not finished()) {
        ++m_in_flight;
        auto entry = m_frontier.pop();
        if (not entry) {
            --m_in_flight;
            std::this_thread::sleep_for(m_config.idle_grace);
            if (m_frontier.empty() && m_in_flight.load() == 0) {
                break;
            }
            continue;
        }
        try {
            process(*entry);
        } catch (std::exception const& error) {
            ++m_failed;
            spdlog::warn("Failed to crawl {}: {}", entry->url.to_string(), error.what());
        }
        --m_in_flight;
    }
    spdlog::debug("Worker {} finished", worker);
}

auto Crawler::crawl(std::vector<std::string> const& seeds) -> CrawlStats {
    for (auto const& seed: seeds) {
        if (auto url = Url::try_parse(seed); url) {
            m_frontier.push(std::move(*url), 0);
        } else {
            spdlog::warn("Ignoring invalid seed URL: {}", seed);
        }
    }

    auto start = std::chrono::steady_clock::now();
    tbb::task_group workers;
    for (std::size_t worker = 0; worker < m_config.workers; ++worker) {
        workers.run([this, worker] { work(worker); });
    }
    try {
        workers.wait();
    } catch (...) {
        m_channel.close();
        throw;
    }
    m_channel.close();

    CrawlStats stats{m_fetched.load(), m_emitted.load(), m_skipped.load(), m_failed.load()};
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
    spdlog::info(
        "Crawler finished in {} s: {} fetched, {} emitted, {} skipped, {} failed",
        elapsed.count(),
        stats.fetched,
        stats.emitted,
        stats.skipped,
        stats.failed
    );
    return stats;
}

}  // namespace resonant::crawl
