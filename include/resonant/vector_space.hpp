#pragma once

#include <complex>
#include <cstddef>
#include <unordered_map>
#include <vector>

#include "type_alias.hpp"

namespace resonant {

/// Term weights keyed by term ID. Weights are non-negative.
using SparseVector = std::unordered_map<TermId, double>;

/// Dense projection of a `SparseVector`, indexed directly by term ID.
using DenseVector = std::vector<double>;

/// Paired representation used for the auxiliary (dual) similarity channel.
struct DualVector {
    SparseVector primary;
    SparseVector secondary;
};

/// Builds a term-frequency vector: raw counts divided by the number of tokens.
[[nodiscard]] auto build_vector(std::vector<TermId> const& tokens) -> SparseVector;

/// Sum of weight products over shared terms; 0 for disjoint supports.
[[nodiscard]] auto dot_product(SparseVector const& lhs, SparseVector const& rhs) -> double;

/// Builds the dual vector: each occurrence puts half of its mass in each component, and both
/// components are normalized by the token count.
[[nodiscard]] auto build_dual_vector(std::vector<TermId> const& tokens) -> DualVector;

/**
 * Complex resonance between two vectors.
 *
 * The real part is the dot product damped by `exp(-decay)`. The imaginary part accumulates
 * `ln(term_id) * lhs[t] * rhs[t]` over shared terms and is damped by `exp(-decay / 2)`, i.e., the
 * phase decays at half the rate of the amplitude.
 */
[[nodiscard]] auto resonance(SparseVector const& lhs, SparseVector const& rhs, double decay)
    -> std::complex<double>;

/// Component-wise dot products of two dual vectors, summed.
[[nodiscard]] auto dual_score(DualVector const& query, DualVector const& document) -> double;

/// Projects `sparse` onto `dimension` dense coordinates; term IDs `>= dimension` are dropped.
[[nodiscard]] auto to_dense(SparseVector const& sparse, std::size_t dimension) -> DenseVector;

}  // namespace resonant
