#include "resonant/entropy.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace resonant {

namespace {

    /// Entropy of a histogram with `total` observations.
    auto histogram_entropy(std::vector<std::size_t> const& counts, std::size_t total) -> double {
        double entropy = 0.0;
        for (auto count: counts) {
            if (count > 0) {
                auto p = static_cast<double>(count) / static_cast<double>(total);
                entropy -= p * std::log2(p);
            }
        }
        return entropy;
    }

    /// Maps each of the first `length` values to a bin in `[0, bins)`.
    auto discretize(DenseVector const& values, std::size_t length, std::size_t bins)
        -> std::vector<std::size_t> {
        auto last = std::next(values.begin(), length);
        auto [min, max] = std::minmax_element(values.begin(), last);
        auto width = *max - *min;
        std::vector<std::size_t> binned(length, 0);
        if (width <= 0.0) {
            return binned;
        }
        std::transform(values.begin(), last, binned.begin(), [&, low = *min](double value) {
            auto bin = static_cast<std::size_t>((value - low) / width * static_cast<double>(bins));
            return std::min(bin, bins - 1);
        });
        return binned;
    }

    auto absolute_mass(DenseVector const& dense) -> double {
        return std::accumulate(dense.begin(), dense.end(), 0.0, [](double acc, double value) {
            return acc + std::abs(value);
        });
    }

}  // namespace

auto shannon_entropy(std::vector<TermId> const& tokens) -> double {
    if (tokens.empty()) {
        return 0.0;
    }
    std::unordered_map<TermId, std::size_t> counts;
    for (auto token: tokens) {
        ++counts[token];
    }
    auto total = static_cast<double>(tokens.size());
    double entropy = 0.0;
    for (auto const& entry: counts) {
        auto p = static_cast<double>(entry.second) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

auto mutual_information(DenseVector const& lhs, DenseVector const& rhs) -> double {
    auto length = std::min(lhs.size(), rhs.size());
    if (length == 0) {
        return 0.0;
    }
    constexpr auto bins = MUTUAL_INFORMATION_BINS;
    auto lhs_bins = discretize(lhs, length, bins);
    auto rhs_bins = discretize(rhs, length, bins);

    std::vector<std::size_t> joint(bins * bins, 0);
    std::vector<std::size_t> lhs_marginal(bins, 0);
    std::vector<std::size_t> rhs_marginal(bins, 0);
    for (std::size_t i = 0; i < length; ++i) {
        ++joint[lhs_bins[i] * bins + rhs_bins[i]];
        ++lhs_marginal[lhs_bins[i]];
        ++rhs_marginal[rhs_bins[i]];
    }

    // I(A; B) = H(A) + H(B) - H(A, B)
    auto lhs_entropy = histogram_entropy(lhs_marginal, length);
    auto rhs_entropy = histogram_entropy(rhs_marginal, length);
    auto joint_entropy = histogram_entropy(joint, length);
    auto information = lhs_entropy + rhs_entropy - joint_entropy;
    return std::clamp(information, 0.0, std::min(lhs_entropy, rhs_entropy));
}

auto reversibility(DenseVector const& current, std::span<DenseVector const> history) -> double {
    if (history.empty()) {
        return 1.0;
    }
    double sum = 0.0;
    for (auto const& snapshot: history) {
        sum += mutual_information(current, snapshot);
    }
    return std::clamp(sum / static_cast<double>(history.size()), 0.0, 1.0);
}

auto redundancy(DenseVector const& dense) -> double {
    auto mass = absolute_mass(dense);
    if (mass <= 0.0 || dense.size() < 2) {
        return 0.0;
    }
    double entropy = 0.0;
    for (auto value: dense) {
        if (value != 0.0) {
            auto p = std::abs(value) / mass;
            entropy -= p * std::log2(p);
        }
    }
    auto max_entropy = std::log2(static_cast<double>(dense.size()));
    return std::max(0.0, 1.0 - entropy / max_entropy);
}

auto symmetry(DenseVector const& dense) -> double {
    auto mass = absolute_mass(dense);
    if (mass <= 0.0) {
        return 0.0;
    }
    double asymmetry = 0.0;
    for (std::size_t left = 0, right = dense.size() - 1; left < right; ++left, --right) {
        asymmetry += 2.0 * std::abs(dense[left] - dense[right]);
    }
    return std::max(0.0, 1.0 - asymmetry / (2.0 * mass));
}

auto buffering_capacity(DenseVector const& dense) -> double {
    return redundancy(dense) + symmetry(dense);
}

auto entropy_pressure(double age_days, double update_frequency, double trend_decay) -> double {
    return update_frequency * trend_decay * std::exp(age_days);
}

auto persistence_score(double reversibility, double pressure, double buffering, double fragility)
    -> double {
    if (buffering <= 0.0) {
        return 0.0;
    }
    // Pressure overflows to infinity for old documents; 0 * inf must not reach the exponent.
    auto sensitivity = fragility * (1.0 - reversibility);
    if (sensitivity <= 0.0) {
        return 1.0;
    }
    return std::exp(-sensitivity * (pressure / buffering));
}

}  // namespace resonant
