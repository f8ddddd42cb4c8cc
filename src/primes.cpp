#include "resonant/primes.hpp"

namespace resonant {

auto is_prime(std::uint64_t n) noexcept -> bool {
    if (n < 2) {
        return false;
    }
    if (n < 4) {
        return true;
    }
    if (n % 2 == 0 || n % 3 == 0) {
        return false;
    }
    // Candidates of the form 6k +/- 1.
    for (std::uint64_t d = 5; d <= n / d; d += 6) {
        if (n % d == 0 || n % (d + 2) == 0) {
            return false;
        }
    }
    return true;
}

auto next_prime(std::uint64_t n) noexcept -> std::uint64_t {
    if (n < 2) {
        return 2;
    }
    std::uint64_t candidate = n % 2 == 0 ? n + 1 : n + 2;
    while (not is_prime(candidate)) {
        candidate += 2;
    }
    return candidate;
}

}  // namespace resonant
