#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "constants.hpp"

namespace rrf {

// ---- Gamma selector -------------------------------------------------------
//
// The bandwidth of the approximated kernel is chosen once, when the
// configuration is parsed:
//   FixedScale      "scale"       gamma = 1 / (d * var(X))
//   ClassMedian     "avg_ann"     gamma = 1 / (2 sigma^2), sigma from labels
//   NeighbourBased  "avg_ann_50"  gamma = 1 / (2 sigma^2), sigma from k-NN
//   Explicit        <float>       gamma given directly

struct FixedScale {};

struct ClassMedian {};

struct NeighbourBased {
    std::size_t k_max = DEFAULT_NEIGHBOUR_RANK;
};

struct Explicit {
    double value = 1.0;
};

using GammaSelector = std::variant<FixedScale, ClassMedian, NeighbourBased, Explicit>;

// "scale" | "avg_ann" | "avg_ann_50"; throws ConfigurationError otherwise.
GammaSelector parse_gamma(std::string_view name);

// Explicit selector; throws ConfigurationError unless value is finite and > 0.
GammaSelector explicit_gamma(double value);

// Name used in logs and reprs ("scale", "avg_ann", "avg_ann_50", or the value).
std::string selector_name(const GammaSelector &selector);

namespace heuristics {

// gamma = 1 / (d * var(X)), variance pooled over all n*d entries.
// X: (n, d) row-major
double gamma_scale(const double *X, std::size_t n, std::size_t d);

// For each class c in 0..max(Y): the median over points of class c of the
// distance to the closest point outside c. sigma is the mean of these
// medians and gamma = 1 / (2 sigma^2).
// X: (n, d) row-major
// Y: (n,) int labels, contiguous from 0
double gamma_class_median(const double *X, const int *Y, std::size_t n, std::size_t d);

// Number of neighbours used by the k-NN heuristic:
//   k_max when n >= k_max, n - 2 otherwise. Requires n >= 3.
std::size_t neighbour_count(std::size_t n, std::size_t k_max = DEFAULT_NEIGHBOUR_RANK);

// sigma = mean over points of the distance to the k-th nearest neighbour
// (k = neighbour_count(n, k_max)), gamma = 1 / (2 sigma^2).
// X: (n, d) row-major
double gamma_nearest_neighbour(const double *X, std::size_t n, std::size_t d,
                               std::size_t k_max = DEFAULT_NEIGHBOUR_RANK);

// Dispatch on the selector. Y may be null unless the selector is ClassMedian.
double estimate_gamma(const GammaSelector &selector, const double *X, const int *Y,
                      std::size_t n, std::size_t d);

}  // namespace heuristics
}  // namespace rrf
