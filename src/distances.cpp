// C++ standard library
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

// Project headers
#include "aligned_alloc64.hpp"
#include "blas_config.h"
#include "constants.hpp"
#include "distances.hpp"

namespace rrf::dist {

static inline void rowwise_self_norms(const double *X, std::size_t n, std::size_t d, double *out) {
    // out[i] = sum_k X[i, k]^2  (row-major: row i is contiguous)
    for (std::size_t i = 0; i < n; ++i) {
        const double *row = X + i * d;
        double acc = 0.0;
        for (std::size_t k = 0; k < d; ++k)
            acc += row[k] * row[k];
        out[i] = acc;
    }
}

void squared_distances(const double *X1, const double *X2,
                       std::size_t n1, std::size_t n2, std::size_t d,
                       double *D2) {
    if (!X1 || !X2 || !D2)
        throw std::invalid_argument("squared_distances: null pointer");
    if (n1 == 0 || n2 == 0 || d == 0)
        throw std::invalid_argument("squared_distances: zero dimension");

    // 1) D2 = -2 * X1 @ X2^T
    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                static_cast<blas_int>(n1),            // M
                static_cast<blas_int>(n2),            // N
                static_cast<blas_int>(d),             // K
                -2.0, X1, static_cast<blas_int>(d),   // A, lda
                X2, static_cast<blas_int>(d),         // B, ldb  (Trans)
                0.0, D2, static_cast<blas_int>(n2));  // C, ldc

    std::vector<double> nrm1(n1), nrm2(n2);
    rowwise_self_norms(X1, n1, d, nrm1.data());
    rowwise_self_norms(X2, n2, d, nrm2.data());

    // 2) D2[i, j] += ||x1_i||^2 + ||x2_j||^2, clamp cancellation residue
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n1); ++i) {
        double *row = D2 + static_cast<std::size_t>(i) * n2;
        const double ni = nrm1[static_cast<std::size_t>(i)];
        for (std::size_t j = 0; j < n2; ++j) {
            const double v = row[j] + ni + nrm2[j];
            row[j] = v > 0.0 ? v : 0.0;
        }
    }
}

// Column means of the stacked row sets [X1; X2]
static std::vector<double> stacked_column_means(const double *X1, std::size_t n1,
                                                const double *X2, std::size_t n2,
                                                std::size_t d) {
    std::vector<double> mean(d, 0.0);
    for (std::size_t i = 0; i < n1; ++i)
        for (std::size_t k = 0; k < d; ++k)
            mean[k] += X1[i * d + k];
    for (std::size_t i = 0; i < n2; ++i)
        for (std::size_t k = 0; k < d; ++k)
            mean[k] += X2[i * d + k];
    const double inv = 1.0 / static_cast<double>(n1 + n2);
    for (double &m : mean)
        m *= inv;
    return mean;
}

// out[i, :] = X[i, :] - mean
static void center_rows(const double *X, std::size_t n, std::size_t d, const double *mean,
                        double *out) {
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        const std::size_t iu = static_cast<std::size_t>(i);
        for (std::size_t k = 0; k < d; ++k)
            out[iu * d + k] = X[iu * d + k] - mean[k];
    }
}

static inline double exact_distance(const double *a, const double *b, std::size_t d) {
    double acc = 0.0;
    for (std::size_t k = 0; k < d; ++k) {
        const double diff = a[k] - b[k];
        acc += diff * diff;
    }
    return std::sqrt(acc);
}

// The norm expansion in squared_distances loses the small distances of
// points far from the origin, so both searches run on centred copies and
// only use the BLAS distances to pick a neighbour. The reported distance
// is recomputed from coordinates.

void kth_neighbour_distances(const double *X, std::size_t n, std::size_t d,
                             std::size_t k, double *out) {
    if (!X || !out)
        throw std::invalid_argument("kth_neighbour_distances: null pointer");
    if (n == 0 || d == 0)
        throw std::invalid_argument("kth_neighbour_distances: zero dimension");
    if (k == 0 || k >= n)
        throw std::invalid_argument("kth_neighbour_distances: k must satisfy 1 <= k < n");

    const std::vector<double> mean = stacked_column_means(X, n, nullptr, 0, d);
    AlignedBuffer Xc = make_aligned_buffer(n * d);
    center_rows(X, n, d, mean.data(), Xc.get());

    // Tiles of T query rows against all n references, memory O(T * n).
    // BLAS runs on the main thread, selection per row is OMP-parallel.
    const std::size_t T = std::min(DEFAULT_TILE_SIZE, n);
    AlignedBuffer tile = make_aligned_buffer(T * n);

    for (std::size_t t0 = 0; t0 < n; t0 += T) {
        const std::size_t rows = std::min(T, n - t0);

        squared_distances(Xc.get() + t0 * d, Xc.get(), rows, n, d, tile.get());

#pragma omp parallel
        {
            // Thread-private candidate order
            std::vector<std::size_t> order(n);

#pragma omp for schedule(static)
            for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(rows); ++r) {
                const std::size_t ru = static_cast<std::size_t>(r);
                const std::size_t q = t0 + ru;
                double *row = tile.get() + ru * n;
                // The query is its own 0th neighbour, exactly
                row[q] = 0.0;

                for (std::size_t j = 0; j < n; ++j)
                    order[j] = j;
                std::nth_element(order.begin(), order.begin() + k, order.end(),
                                 [row](std::size_t a, std::size_t b) { return row[a] < row[b]; });

                const std::size_t nb = order[k];
                out[q] = nb == q ? 0.0 : exact_distance(Xc.get() + q * d, Xc.get() + nb * d, d);
            }
        }
    }
}

void min_cross_distances(const double *A, const double *B,
                         std::size_t na, std::size_t nb, std::size_t d,
                         double *out) {
    if (!A || !B || !out)
        throw std::invalid_argument("min_cross_distances: null pointer");
    if (na == 0 || nb == 0 || d == 0)
        throw std::invalid_argument("min_cross_distances: zero dimension");

    const std::vector<double> mean = stacked_column_means(A, na, B, nb, d);
    AlignedBuffer Ac = make_aligned_buffer(na * d);
    AlignedBuffer Bc = make_aligned_buffer(nb * d);
    center_rows(A, na, d, mean.data(), Ac.get());
    center_rows(B, nb, d, mean.data(), Bc.get());

    const std::size_t T = std::min(DEFAULT_TILE_SIZE, na);
    AlignedBuffer tile = make_aligned_buffer(T * nb);

    for (std::size_t t0 = 0; t0 < na; t0 += T) {
        const std::size_t rows = std::min(T, na - t0);

        squared_distances(Ac.get() + t0 * d, Bc.get(), rows, nb, d, tile.get());

#pragma omp parallel for schedule(static)
        for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(rows); ++r) {
            const std::size_t ru = static_cast<std::size_t>(r);
            const double *row = tile.get() + ru * nb;
            const std::size_t best = static_cast<std::size_t>(std::min_element(row, row + nb) - row);
            out[t0 + ru] = exact_distance(Ac.get() + (t0 + ru) * d, Bc.get() + best * d, d);
        }
    }
}

}  // namespace rrf::dist
