#include "resonant/vector_space.hpp"

#include <cmath>

namespace resonant {

namespace {

    /// Calls `fn(term, lhs_weight, rhs_weight)` for every term present in both vectors.
    template <typename Fn>
    void for_each_shared(SparseVector const& lhs, SparseVector const& rhs, Fn&& fn) {
        auto const& smaller = lhs.size() <= rhs.size() ? lhs : rhs;
        auto const& larger = lhs.size() <= rhs.size() ? rhs : lhs;
        for (auto const& [term, weight]: smaller) {
            if (auto pos = larger.find(term); pos != larger.end()) {
                fn(term, weight, pos->second);
            }
        }
    }

    void scale(SparseVector& vector, double factor) {
        for (auto& entry: vector) {
            entry.second *= factor;
        }
    }

}  // namespace

auto build_vector(std::vector<TermId> const& tokens) -> SparseVector {
    SparseVector vector;
    for (auto token: tokens) {
        vector[token] += 1.0;
    }
    if (not tokens.empty()) {
        scale(vector, 1.0 / static_cast<double>(tokens.size()));
    }
    return vector;
}

auto dot_product(SparseVector const& lhs, SparseVector const& rhs) -> double {
    double sum = 0.0;
    for_each_shared(lhs, rhs, [&](TermId, double left, double right) { sum += left * right; });
    return sum;
}

auto build_dual_vector(std::vector<TermId> const& tokens) -> DualVector {
    DualVector dual;
    for (auto token: tokens) {
        dual.primary[token] += 0.5;
        dual.secondary[token] += 0.5;
    }
    if (not tokens.empty()) {
        auto factor = 1.0 / static_cast<double>(tokens.size());
        scale(dual.primary, factor);
        scale(dual.secondary, factor);
    }
    return dual;
}

auto resonance(SparseVector const& lhs, SparseVector const& rhs, double decay)
    -> std::complex<double> {
    double real = 0.0;
    double phase = 0.0;
    for_each_shared(lhs, rhs, [&](TermId term, double left, double right) {
        real += left * right;
        phase += std::log(static_cast<double>(term)) * left * right;
    });
    return {real * std::exp(-decay), phase * std::exp(-decay * 0.5)};
}

auto dual_score(DualVector const& query, DualVector const& document) -> double {
    return dot_product(query.primary, document.primary)
        + dot_product(query.secondary, document.secondary);
}

auto to_dense(SparseVector const& sparse, std::size_t dimension) -> DenseVector {
    DenseVector dense(dimension, 0.0);
    for (auto const& [term, weight]: sparse) {
        if (term < dimension) {
            dense[term] = weight;
        }
    }
    return dense;
}

}  // namespace resonant
