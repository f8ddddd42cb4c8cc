#include "resonant/crawl/rate_limiter.hpp"

#include <cstdint>
#include <thread>

namespace resonant::crawl {

HostRateLimiter::HostRateLimiter(std::chrono::milliseconds delay, std::uint_fast32_t seed)
    : m_delay(delay), m_random(seed) {}

auto HostRateLimiter::host_mutex(std::string const& host) -> std::mutex& {
    std::lock_guard lock(m_hosts_mutex);
    auto& mutex = m_hosts[host];
    if (mutex == nullptr) {
        mutex = std::make_unique<std::mutex>();
    }
    return *mutex;
}

auto HostRateLimiter::jittered_delay() -> std::chrono::microseconds {
    double factor = 0.0;
    {
        std::lock_guard lock(m_random_mutex);
        factor = m_jitter(m_random);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(m_delay).count();
    return std::chrono::microseconds(static_cast<std::int64_t>(static_cast<double>(micros) * factor));
}

void HostRateLimiter::wait(std::string const& host) {
    auto& mutex = host_mutex(host);
    std::lock_guard lock(mutex);
    if (m_delay.count() > 0) {
        std::this_thread::sleep_for(jittered_delay());
    }
}

auto HostRateLimiter::hosts() const -> std::size_t {
    std::lock_guard lock(m_hosts_mutex);
    return m_hosts.size();
}

}  // namespace resonant::crawl
