// C++ standard library
#include <cmath>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

// Project headers
#include "relu_weights.hpp"

namespace rrf::relu {

void sample_relu_weights(std::size_t d, std::size_t D, std::mt19937_64 &rng, double *W) {
    if (!W)
        throw std::invalid_argument("sample_relu_weights: null pointer");
    if (D == 0)
        throw std::invalid_argument("sample_relu_weights: zero dimension");

    const std::size_t rows = d + 1;
    std::normal_distribution<double> normal(0.0, 1.0);

    // Draws stay serial so a seed reproduces W bit for bit
    for (std::size_t idx = 0; idx < rows * D; ++idx)
        W[idx] = normal(rng);

    std::vector<double> norms(D, 0.0);
    for (std::size_t r = 0; r < rows; ++r) {
        const double *w_row = W + r * D;
        for (std::size_t c = 0; c < D; ++c)
            norms[c] += w_row[c] * w_row[c];
    }

    for (std::size_t c = 0; c < D; ++c) {
        while (!(norms[c] > 0.0)) {
            norms[c] = 0.0;
            for (std::size_t r = 0; r < rows; ++r) {
                const double v = normal(rng);
                W[r * D + c] = v;
                norms[c] += v * v;
            }
        }
        norms[c] = std::sqrt(norms[c]);
    }

    // W[:, c] /= ||W[:, c]||
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(rows); ++r) {
        double *w_row = W + static_cast<std::size_t>(r) * D;
        for (std::size_t c = 0; c < D; ++c)
            w_row[c] /= norms[c];
    }
}

}  // namespace rrf::relu
