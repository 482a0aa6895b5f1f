#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "constants.hpp"
#include "gamma_heuristics.hpp"

namespace rrf {

struct FeatureMapConfig {
    GammaSelector gamma = NeighbourBased{};
    std::size_t n_components = DEFAULT_N_COMPONENTS;
    // Unset: draw from an engine seeded by std::random_device
    std::optional<std::uint64_t> random_state;
    // Prepend a constant 1 to eval_x() rows
    bool fit_intercept = true;
};

// Everything transform() needs, produced once per fit and never modified.
struct FittedFeatureMap {
    double gamma = 0.0;
    std::size_t n_features = 0;
    std::size_t n_components = 0;
    std::vector<double> weights;  // (n_features+1, n_components) row-major, unit columns
};

// Estimate gamma and draw the weights. Nothing is published if either step throws.
// X: (n, d) row-major, Y: (n,) labels or null
std::shared_ptr<const FittedFeatureMap> fit_feature_map(const FeatureMapConfig &config,
                                                        const double *X, const int *Y,
                                                        std::size_t n, std::size_t d,
                                                        std::mt19937_64 &rng);

// Random ReLU feature map approximating a Gaussian-like kernel:
//   phi(x) = max(0, W^T [1/gamma, x])
// with W uniform on the unit sphere in d+1 dimensions.
//
// Lifecycle: unfit -> fit() -> any number of const transform() calls.
// A new fit() replaces the fitted state as a whole; a failing fit() keeps
// the previous one. transform() is safe to call concurrently.
class RandomReLUFeatures {
  public:
    explicit RandomReLUFeatures(FeatureMapConfig config = {});

    // Labels are only read when the selector is ClassMedian.
    RandomReLUFeatures &fit(const double *X, std::size_t n, std::size_t d,
                            const int *Y = nullptr);

    // Same, drawing the weights from a caller-owned engine; random_state is ignored.
    RandomReLUFeatures &fit(const double *X, std::size_t n, std::size_t d, const int *Y,
                            std::mt19937_64 &rng);

    // Z: (n, n_components) row-major
    void transform(const double *X, std::size_t n, std::size_t d, double *Z) const;
    std::vector<double> transform(const double *X, std::size_t n, std::size_t d) const;

    // Features for a linear model: transform() plus a leading column of ones
    // when fit_intercept is set. out: (n, feature_length()) row-major
    void eval_x(const double *X, std::size_t n, std::size_t d, double *out) const;
    std::vector<double> eval_x(const double *X, std::size_t n, std::size_t d) const;

    bool is_fitted() const { return static_cast<bool>(state_); }

    // Throws NotFittedError before the first successful fit().
    const FittedFeatureMap &fitted() const;

    // Shared handle to the fitted state, null when unfit.
    std::shared_ptr<const FittedFeatureMap> fitted_state() const { return state_; }

    double gamma() const { return fitted().gamma; }

    // n_components + fit_intercept; throws NotFittedError when unfit.
    std::size_t feature_length() const;

    const FeatureMapConfig &config() const { return config_; }

  private:
    const FittedFeatureMap &require_fitted(std::size_t d) const;

    FeatureMapConfig config_;
    std::mt19937_64 rng_;
    std::shared_ptr<const FittedFeatureMap> state_;
};

}  // namespace rrf
