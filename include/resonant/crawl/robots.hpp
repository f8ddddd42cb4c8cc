#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "http_client.hpp"
#include "url.hpp"

namespace resonant::crawl {

/**
 * Access rules of a single robots.txt group.
 *
 * A path is checked against all `Allow` and `Disallow` patterns; the longest matching pattern
 * decides, and `Allow` wins a tie. A path matched by no pattern is allowed.
 */
class RobotsRules {
  public:
    struct Rule {
        std::string pattern;
        bool allow;
    };

    RobotsRules() = default;
    explicit RobotsRules(std::vector<Rule> rules);

    /**
     * Parses robots.txt and keeps the rules applicable to `user_agent`.
     *
     * The groups naming our product token (the user agent up to the first `/`, matched
     * case-insensitively) take precedence over the `*` groups; if neither exists, all paths are
     * allowed.
     */
    [[nodiscard]] static auto parse(std::string_view text, std::string_view user_agent) -> RobotsRules;

    /// Whether `path` (including the query string) may be fetched.
    [[nodiscard]] auto allows(std::string_view path) const -> bool;

    [[nodiscard]] auto rules() const noexcept -> std::vector<Rule> const& { return m_rules; }

  private:
    std::vector<Rule> m_rules;
};

/// Matches a robots.txt path pattern, where `*` matches any sequence and a trailing `$` anchors
/// the pattern at the end of the path. Unanchored patterns match prefixes.
[[nodiscard]] auto robots_pattern_matches(std::string_view pattern, std::string_view path) -> bool;

/**
 * Per-origin cache of robots.txt rules.
 *
 * Rules are fetched on first use and kept for `ttl`. Any failure to obtain robots.txt, including an
 * error status, allows everything. The lock is never held while fetching, so two workers may fetch
 * the same robots.txt concurrently; the later result wins.
 */
class RobotsCache {
  public:
    RobotsCache(HttpClient& client, std::string user_agent, std::chrono::seconds ttl);

    [[nodiscard]] auto allows(Url const& url) -> bool;

    /// Number of cached origins.
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    struct Entry {
        RobotsRules rules;
        std::chrono::steady_clock::time_point fetched_at;
    };

    [[nodiscard]] auto fetch(Url const& url) -> RobotsRules;

    HttpClient& m_client;
    std::string m_user_agent;
    std::chrono::seconds m_ttl;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

}  // namespace resonant::crawl
