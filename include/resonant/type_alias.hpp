#pragma once

#include <cstdint>

namespace resonant {

/// Term identifier; always a prime number assigned by `PrimeTokenizer`.
using TermId = std::uint64_t;

/// Whole seconds since the Unix epoch.
using Timestamp = std::uint64_t;

constexpr Timestamp SECONDS_PER_DAY = 24 * 3600;

}  // namespace resonant
