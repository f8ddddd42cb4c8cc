#include "resonant/crawl/frontier.hpp"

#include <utility>

namespace resonant::crawl {

void Frontier::push(Url url, std::uint32_t depth) {
    if (is_visited(url)) {
        return;
    }
    std::lock_guard lock(m_queue_mutex);
    m_queue.push_back(FrontierEntry{std::move(url), depth});
}

auto Frontier::pop() -> std::optional<FrontierEntry> {
    std::lock_guard lock(m_queue_mutex);
    if (m_queue.empty()) {
        return std::nullopt;
    }
    auto entry = std::move(m_queue.front());
    m_queue.pop_front();
    return entry;
}

auto Frontier::empty() const -> bool {
    std::lock_guard lock(m_queue_mutex);
    return m_queue.empty();
}

auto Frontier::size() const -> std::size_t {
    std::lock_guard lock(m_queue_mutex);
    return m_queue.size();
}

auto Frontier::mark_visited(Url const& url) -> bool {
    std::lock_guard lock(m_visited_mutex);
    return m_visited.insert(url.to_string()).second;
}

auto Frontier::is_visited(Url const& url) const -> bool {
    std::lock_guard lock(m_visited_mutex);
    return m_visited.find(url.to_string()) != m_visited.end();
}

auto Frontier::visited() const -> std::size_t {
    std::lock_guard lock(m_visited_mutex);
    return m_visited.size();
}

}  // namespace resonant::crawl
