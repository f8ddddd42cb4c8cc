#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

#include <tbb/concurrent_queue.h>

#include "document.hpp"

namespace resonant {

/**
 * Bounded multi-producer channel of crawled documents.
 *
 * The capacity is the backpressure control between the crawler and the ingesting consumer:
 * once the channel is full, `send` blocks until the consumer catches up.
 */
class DocumentChannel {
  public:
    explicit DocumentChannel(std::size_t capacity) {
        m_queue.set_capacity(static_cast<std::ptrdiff_t>(capacity));
    }

    DocumentChannel(DocumentChannel const&) = delete;
    DocumentChannel(DocumentChannel&&) = delete;
    DocumentChannel& operator=(DocumentChannel const&) = delete;
    DocumentChannel& operator=(DocumentChannel&&) = delete;
    ~DocumentChannel() = default;

    /// Blocks while the channel is full.
    void send(CrawledDocument document) { m_queue.push(std::move(document)); }

    /// Signals the consumer that no more documents will be sent. Blocks while the channel is full.
    void close() { m_queue.push(std::nullopt); }

    /// Blocks until a document is available; returns `std::nullopt` once the channel is closed.
    [[nodiscard]] auto receive() -> std::optional<CrawledDocument> {
        if (m_closed.load()) {
            return std::nullopt;
        }
        std::optional<CrawledDocument> document;
        m_queue.pop(document);
        if (not document) {
            m_closed.store(true);
        }
        return document;
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return static_cast<std::size_t>(m_queue.capacity());
    }

    /// Number of documents waiting; approximate while producers are active.
    [[nodiscard]] auto pending() const -> std::size_t {
        auto size = m_queue.size();
        return size > 0 ? static_cast<std::size_t>(size) : 0;
    }

  private:
    tbb::concurrent_bounded_queue<std::optional<CrawledDocument>> m_queue;
    std::atomic_bool m_closed = false;
};

}  // namespace resonant
