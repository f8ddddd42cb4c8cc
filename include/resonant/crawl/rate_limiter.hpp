#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace resonant::crawl {

/**
 * Serializes requests to the same host and spaces them out.
 *
 * Every host gets its own lazily created mutex. `wait` acquires it and sleeps for the base delay
 * scaled by a uniform random factor in `[0.8, 1.2]` before releasing it, so requests to one host
 * are at least `0.8 * delay` apart while different hosts never wait on each other.
 *
 * The map of hosts is never pruned; a long-running crawl over many distinct hosts grows it without
 * bound.
 */
class HostRateLimiter {
  public:
    static constexpr double MIN_JITTER = 0.8;
    static constexpr double MAX_JITTER = 1.2;

    explicit HostRateLimiter(std::chrono::milliseconds delay, std::uint_fast32_t seed = std::random_device{}());

    /// Blocks until a request to `host` may be sent.
    void wait(std::string const& host);

    /// Number of hosts seen so far.
    [[nodiscard]] auto hosts() const -> std::size_t;

  private:
    [[nodiscard]] auto host_mutex(std::string const& host) -> std::mutex&;
    [[nodiscard]] auto jittered_delay() -> std::chrono::microseconds;

    std::chrono::milliseconds m_delay;
    mutable std::mutex m_hosts_mutex;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> m_hosts;
    std::mutex m_random_mutex;
    std::mt19937 m_random;
    std::uniform_real_distribution<double> m_jitter{MIN_JITTER, MAX_JITTER};
};

}  // namespace resonant::crawl
