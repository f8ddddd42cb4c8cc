#include "resonant/crawl/robots.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

namespace resonant::crawl {

namespace {

    struct Group {
        std::vector<std::string> agents;
        std::vector<RobotsRules::Rule> rules;
    };

    [[nodiscard]] auto product_token(std::string_view user_agent) -> std::string {
        auto token = user_agent.substr(0, user_agent.find('/'));
        return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(token)));
    }

    [[nodiscard]] auto parse_groups(std::string_view text) -> std::vector<Group> {
        std::vector<Group> groups;
        bool in_agent_lines = false;
        std::vector<std::string> lines;
        boost::algorithm::split(lines, std::string(text), boost::algorithm::is_any_of("\n"));
        for (auto& line: lines) {
            if (auto hash = line.find('#'); hash != std::string::npos) {
                line.erase(hash);
            }
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            auto key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, colon)));
            auto value = boost::algorithm::trim_copy(line.substr(colon + 1));
            if (key == "user-agent") {
                if (not in_agent_lines) {
                    groups.emplace_back();
                    in_agent_lines = true;
                }
                groups.back().agents.push_back(boost::algorithm::to_lower_copy(value));
                continue;
            }
            if (key != "allow" && key != "disallow") {
                continue;
            }
            in_agent_lines = false;
            if (groups.empty() || value.empty()) {
                continue;
            }
            groups.back().rules.push_back(RobotsRules::Rule{value, key == "allow"});
        }
        return groups;
    }

}  // namespace

auto robots_pattern_matches(std::string_view pattern, std::string_view path) -> bool {
    bool anchored = pattern.ends_with('$');
    if (anchored) {
        pattern.remove_suffix(1);
    }
    std::size_t pat = 0;
    std::size_t pos = 0;
    std::optional<std::size_t> star;
    std::size_t star_pos = 0;
    while (pos < path.size()) {
        if (not anchored && pat == pattern.size()) {
            return true;
        }
        if (pat < pattern.size() && pattern[pat] == '*') {
            star = pat++;
            star_pos = pos;
        } else if (pat < pattern.size() && pattern[pat] == path[pos]) {
            ++pat;
            ++pos;
        } else if (star) {
            pat = *star + 1;
            pos = ++star_pos;
        } else {
            return false;
        }
    }
    while (pat < pattern.size() && pattern[pat] == '*') {
        ++pat;
    }
    return pat == pattern.size();
}

RobotsRules::RobotsRules(std::vector<Rule> rules) : m_rules(std::move(rules)) {}

auto RobotsRules::parse(std::string_view text, std::string_view user_agent) -> RobotsRules {
    auto token = product_token(user_agent);
    std::vector<Rule> specific;
    std::vector<Rule> wildcard;
    bool has_specific = false;
    for (auto& group: parse_groups(text)) {
        bool names_us = std::any_of(group.agents.begin(), group.agents.end(), [&](auto const& agent) {
            return agent != "*" && not agent.empty() && product_token(agent) == token;
        });
        bool names_all = std::find(group.agents.begin(), group.agents.end(), "*") != group.agents.end();
        if (names_us) {
            has_specific = true;
            std::move(group.rules.begin(), group.rules.end(), std::back_inserter(specific));
        } else if (names_all) {
            std::move(group.rules.begin(), group.rules.end(), std::back_inserter(wildcard));
        }
    }
    return RobotsRules(has_specific ? std::move(specific) : std::move(wildcard));
}

auto RobotsRules::allows(std::string_view path) const -> bool {
    std::size_t best_length = 0;
    bool allowed = true;
    bool matched = false;
    for (auto const& rule: m_rules) {
        if (not robots_pattern_matches(rule.pattern, path)) {
            continue;
        }
        auto length = rule.pattern.size();
        if (not matched || length > best_length || (length == best_length && rule.allow)) {
            best_length = length;
            allowed = rule.allow;
            matched = true;
        }
    }
    return allowed;
}

RobotsCache::RobotsCache(HttpClient& client, std::string user_agent, std::chrono::seconds ttl)
    : m_client(client), m_user_agent(std::move(user_agent)), m_ttl(ttl) {}

auto RobotsCache::fetch(Url const& url) -> RobotsRules {
    auto robots_url = Url::parse(url.origin() + "/robots.txt");
    try {
        auto response = m_client.get(robots_url);
        if (not response.is_success()) {
            spdlog::debug("{} returned status {}, allowing all", robots_url.to_string(), response.status);
            return RobotsRules{};
        }
        return RobotsRules::parse(response.body, m_user_agent);
    } catch (FetchError const& error) {
        spdlog::debug("Cannot fetch {}, allowing all: {}", robots_url.to_string(), error.what());
        return RobotsRules{};
    }
}

auto RobotsCache::allows(Url const& url) -> bool {
    auto origin = url.origin();
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(m_mutex);
        if (auto pos = m_entries.find(origin);
            pos != m_entries.end() && now - pos->second.fetched_at < m_ttl) {
            return pos->second.rules.allows(url.path_and_query());
        }
    }
    auto rules = fetch(url);
    bool allowed = rules.allows(url.path_and_query());
    std::lock_guard lock(m_mutex);
    m_entries.insert_or_assign(origin, Entry{std::move(rules), now});
    return allowed;
}

auto RobotsCache::size() const -> std::size_t {
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

}  // namespace resonant::crawl
