#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "type_alias.hpp"
#include "vector_space.hpp"

namespace resonant {

/// Number of equal-width bins per vector used by the mutual information estimator.
constexpr std::size_t MUTUAL_INFORMATION_BINS = 10;

/// Shannon entropy (in bits) of the empirical distribution of `tokens`.
[[nodiscard]] auto shannon_entropy(std::vector<TermId> const& tokens) -> double;

/**
 * Mutual information (in bits) between two dense vectors.
 *
 * Each vector is discretized into `MUTUAL_INFORMATION_BINS` equal-width bins spanning its own
 * `[min, max]` range, and the plug-in estimate is computed over the joint histogram of the
 * coordinate pairs. If the vectors differ in length, only the common prefix is considered.
 * The result is in `[0, min(H(A), H(B))]`, where `H` is the entropy of the binned marginal.
 */
[[nodiscard]] auto mutual_information(DenseVector const& lhs, DenseVector const& rhs) -> double;

/// Mean mutual information between `current` and each snapshot, clamped to `[0, 1]`.
/// A vector with no history is fully reversible: returns 1.0.
[[nodiscard]] auto reversibility(DenseVector const& current, std::span<DenseVector const> history)
    -> double;

/// `1 - H(mass) / log2(n)`: how compressible the distribution of absolute mass is.
[[nodiscard]] auto redundancy(DenseVector const& dense) -> double;

/// `1 - sum |x[i] - x[n-1-i]| / (2 * sum |x[i]|)`: evenness of mass about the center.
[[nodiscard]] auto symmetry(DenseVector const& dense) -> double;

/// Structural buffering: `redundancy + symmetry`, never negative.
[[nodiscard]] auto buffering_capacity(DenseVector const& dense) -> double;

/// `update_frequency * trend_decay * exp(age_days)`.
///
/// Note that this grows with age rather than decaying.
[[nodiscard]] auto entropy_pressure(double age_days, double update_frequency, double trend_decay)
    -> double;

/**
 * Persistence of a document under entropy pressure.
 *
 * Returns `exp(-fragility * (1 - reversibility) * pressure / buffering)`, which lies in `(0, 1]`,
 * or 0 if `buffering <= 0`.
 */
[[nodiscard]] auto
persistence_score(double reversibility, double pressure, double buffering, double fragility)
    -> double;

}  // namespace resonant
