// C++ standard library
#include <cstddef>
#include <cstring>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Project headers
#include "aligned_alloc64.hpp"
#include "errors.hpp"
#include "feature_map.hpp"
#include "log.hpp"
#include "relu_features.hpp"
#include "relu_weights.hpp"

namespace rrf {

std::shared_ptr<const FittedFeatureMap> fit_feature_map(const FeatureMapConfig &config,
                                                        const double *X, const int *Y,
                                                        std::size_t n, std::size_t d,
                                                        std::mt19937_64 &rng) {
    if (!X)
        throw std::invalid_argument("fit: null pointer");
    if (n == 0 || d == 0)
        throw std::invalid_argument("fit: X must have at least one sample and one feature");
    if (config.n_components == 0)
        throw ConfigurationError("n_components must be > 0");

    auto state = std::make_shared<FittedFeatureMap>();
    state->gamma = heuristics::estimate_gamma(config.gamma, X, Y, n, d);
    state->n_features = d;
    state->n_components = config.n_components;
    state->weights.resize((d + 1) * config.n_components);
    relu::sample_relu_weights(d, config.n_components, rng, state->weights.data());

    RRF_LOG("fit: n=%zu d=%zu n_components=%zu gamma=%g", n, d, config.n_components,
            state->gamma);
    return state;
}

RandomReLUFeatures::RandomReLUFeatures(FeatureMapConfig config)
    : config_(std::move(config)), rng_(std::random_device{}()) {}

RandomReLUFeatures &RandomReLUFeatures::fit(const double *X, std::size_t n, std::size_t d,
                                            const int *Y) {
    if (config_.random_state) {
        // A seeded map draws the same weights on every fit
        std::mt19937_64 seeded(*config_.random_state);
        return fit(X, n, d, Y, seeded);
    }
    return fit(X, n, d, Y, rng_);
}

RandomReLUFeatures &RandomReLUFeatures::fit(const double *X, std::size_t n, std::size_t d,
                                            const int *Y, std::mt19937_64 &rng) {
    state_ = fit_feature_map(config_, X, Y, n, d, rng);
    return *this;
}

const FittedFeatureMap &RandomReLUFeatures::fitted() const {
    if (!state_)
        throw NotFittedError("This RandomReLUFeatures instance is not fitted yet; call fit() first");
    return *state_;
}

const FittedFeatureMap &RandomReLUFeatures::require_fitted(std::size_t d) const {
    const FittedFeatureMap &fm = fitted();
    if (d != fm.n_features)
        throw DimensionMismatchError("X has " + std::to_string(d) + " features, but the map was fitted with " +
                                     std::to_string(fm.n_features));
    return fm;
}

std::size_t RandomReLUFeatures::feature_length() const {
    return fitted().n_components + (config_.fit_intercept ? 1 : 0);
}

void RandomReLUFeatures::transform(const double *X, std::size_t n, std::size_t d,
                                   double *Z) const {
    const FittedFeatureMap &fm = require_fitted(d);
    relu::relu_features(X, fm.weights.data(), fm.gamma, n, fm.n_features, fm.n_components, Z);
}

std::vector<double> RandomReLUFeatures::transform(const double *X, std::size_t n,
                                                  std::size_t d) const {
    const FittedFeatureMap &fm = require_fitted(d);
    std::vector<double> Z(n * fm.n_components);
    transform(X, n, d, Z.data());
    return Z;
}

void RandomReLUFeatures::eval_x(const double *X, std::size_t n, std::size_t d,
                                double *out) const {
    const FittedFeatureMap &fm = require_fitted(d);
    if (!config_.fit_intercept) {
        transform(X, n, d, out);
        return;
    }

    const std::size_t D = fm.n_components;
    AlignedBuffer Z = make_aligned_buffer(n * D);
    transform(X, n, d, Z.get());

    // out = [1, Z]
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        const std::size_t iu = static_cast<std::size_t>(i);
        double *row = out + iu * (D + 1);
        row[0] = 1.0;
        std::memcpy(row + 1, Z.get() + iu * D, D * sizeof(double));
    }
}

std::vector<double> RandomReLUFeatures::eval_x(const double *X, std::size_t n,
                                               std::size_t d) const {
    std::vector<double> out(n * feature_length());
    eval_x(X, n, d, out.data());
    return out;
}

}  // namespace rrf
