// C++ standard library
#include <cmath>
#include <cstddef>
#include <cstring>
#include <stdexcept>

// Project headers
#include "aligned_alloc64.hpp"
#include "blas_config.h"
#include "relu_features.hpp"

namespace rrf::relu {

void relu_features(const double *X, const double *W, double gamma,
                   std::size_t N, std::size_t d, std::size_t D,
                   double *Z) {
    if (!W || !Z || (d > 0 && !X))
        throw std::invalid_argument("relu_features: null pointer");
    if (N == 0 || D == 0)
        throw std::invalid_argument("relu_features: zero dimension");
    if (!std::isfinite(gamma) || !(gamma > 0.0))
        throw std::invalid_argument("relu_features: gamma must be finite and > 0");

    const std::size_t K = d + 1;
    const double bias = 1.0 / gamma;

    // Xa = [1/gamma, X]  (N, d+1)
    AlignedBuffer Xa = make_aligned_buffer(N * K);
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(N); ++i) {
        const std::size_t iu = static_cast<std::size_t>(i);
        double *xa = Xa.get() + iu * K;
        xa[0] = bias;
        if (d > 0)
            std::memcpy(xa + 1, X + iu * d, d * sizeof(double));
    }

    // Z = Xa @ W  via DGEMM
    // Xa is (N, d+1), W is (d+1, D), Z is (N, D)
    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans,
                static_cast<blas_int>(N),                // M
                static_cast<blas_int>(D),                // N
                static_cast<blas_int>(K),                // K
                1.0, Xa.get(), static_cast<blas_int>(K), // A, lda
                W, static_cast<blas_int>(D),             // B, ldb
                0.0, Z, static_cast<blas_int>(D));       // C, ldc

    // ReLU in place
    const std::size_t total = N * D;
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t idx = 0; idx < static_cast<std::ptrdiff_t>(total); ++idx) {
        double &z = Z[static_cast<std::size_t>(idx)];
        if (!(z > 0.0))
            z = 0.0;
    }
}

}  // namespace rrf::relu
