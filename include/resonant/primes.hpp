#pragma once

#include <cstdint>

namespace resonant {

/// Trial-division primality test.
[[nodiscard]] auto is_prime(std::uint64_t n) noexcept -> bool;

/// Returns the smallest prime strictly greater than `n`.
[[nodiscard]] auto next_prime(std::uint64_t n) noexcept -> std::uint64_t;

}  // namespace resonant
