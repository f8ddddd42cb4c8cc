#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <utility>

namespace resonant {

/**
 * Fixed-capacity FIFO of snapshots.
 *
 * Slots are filled in order until the ring is full; afterwards every push overwrites the oldest
 * snapshot, tracked by a write cursor. The filled slots are always the contiguous prefix
 * `[0, size())`, although not in insertion order once the ring has wrapped.
 */
template <typename T, std::size_t Capacity>
class HistoryRing {
    static_assert(Capacity > 0, "history capacity must be positive");

  public:
    static constexpr std::size_t capacity = Capacity;

    void push(T snapshot) {
        m_slots[m_cursor] = std::move(snapshot);
        m_cursor = (m_cursor + 1) % Capacity;
        if (m_size < Capacity) {
            ++m_size;
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return m_size; }
    [[nodiscard]] auto empty() const noexcept -> bool { return m_size == 0; }

    /// Snapshots currently held, in storage order.
    [[nodiscard]] auto snapshots() const noexcept -> std::span<T const> {
        return std::span<T const>(m_slots.data(), m_size);
    }

    /// The most recently pushed snapshot. Undefined if empty.
    [[nodiscard]] auto newest() const -> T const& {
        return m_slots[(m_cursor + Capacity - 1) % Capacity];
    }

    /// The oldest snapshot still held. Undefined if empty.
    [[nodiscard]] auto oldest() const -> T const& {
        return m_size < Capacity ? m_slots[0] : m_slots[m_cursor];
    }

  private:
    std::array<T, Capacity> m_slots{};
    std::size_t m_cursor = 0;
    std::size_t m_size = 0;
};

}  // namespace resonant
