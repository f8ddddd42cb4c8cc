#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "url.hpp"

namespace resonant::crawl {

struct FrontierEntry {
    Url url;
    std::uint32_t depth;
};

/**
 * FIFO of URLs waiting to be crawled, together with the set of URLs already visited.
 *
 * The queue and the visited set are guarded by separate mutexes. A URL is considered visited once
 * a worker claims it with `mark_visited`, which happens right after dequeuing and before fetching,
 * so that no two workers fetch the same URL.
 */
class Frontier {
  public:
    /// Enqueues `url` unless it has already been visited.
    void push(Url url, std::uint32_t depth);

    [[nodiscard]] auto pop() -> std::optional<FrontierEntry>;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

    /// Marks `url` as visited. Returns `false` if it had already been visited.
    [[nodiscard]] auto mark_visited(Url const& url) -> bool;
    [[nodiscard]] auto is_visited(Url const& url) const -> bool;
    [[nodiscard]] auto visited() const -> std::size_t;

  private:
    mutable std::mutex m_queue_mutex;
    std::deque<FrontierEntry> m_queue;
    mutable std::mutex m_visited_mutex;
    std::unordered_set<std::string> m_visited;
};

}  // namespace resonant::crawl
