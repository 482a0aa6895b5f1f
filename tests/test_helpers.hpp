#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace rrf::test_util {

// (n, d) row-major matrix of N(mean, 1) entries
inline std::vector<double> random_matrix(std::size_t n, std::size_t d, std::uint64_t seed,
                                         double mean = 0.0) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(mean, 1.0);
    std::vector<double> X(n * d);
    for (double &x : X)
        x = normal(rng);
    return X;
}

// Two Gaussian blobs centred at -2 and +2, labels 0 / 1
inline std::vector<double> two_blobs(std::size_t n_per_class, std::size_t d,
                                     std::vector<int> &labels, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, 0.5);
    std::vector<double> X(2 * n_per_class * d);
    labels.assign(2 * n_per_class, 0);
    for (std::size_t i = 0; i < 2 * n_per_class; ++i) {
        const bool second = i >= n_per_class;
        labels[i] = second ? 1 : 0;
        for (std::size_t k = 0; k < d; ++k)
            X[i * d + k] = (second ? 2.0 : -2.0) + noise(rng);
    }
    return X;
}

}  // namespace rrf::test_util
