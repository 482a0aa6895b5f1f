#pragma once

#include <cstddef>

namespace rrf::dist {

// Squared Euclidean distances between two row sets:
//   D2[i, j] = ||X1[i,:] - X2[j,:]||^2
//
// X1: (n1, d) row-major
// X2: (n2, d) row-major
// D2: (n1, n2) row-major output, entries clamped to >= 0
void squared_distances(const double *X1, const double *X2,
                       std::size_t n1, std::size_t n2, std::size_t d,
                       double *D2);

// Distance from every row of X to its k-th nearest neighbour, where the
// row itself is neighbour 0. Equivalent to column k of a sorted
// k+1-neighbour query against X. The neighbour is chosen on a centred
// copy of X and its distance recomputed from coordinates, so the result
// does not depend on where the cloud sits.
//
// X:   (n, d) row-major
// k:   1 <= k < n
// out: (n,) output
void kth_neighbour_distances(const double *X, std::size_t n, std::size_t d,
                             std::size_t k, double *out);

// Distance from every row of A to the closest row of B. Same centring and
// exact recomputation as kth_neighbour_distances.
//
// A:   (na, d) row-major
// B:   (nb, d) row-major, nb >= 1
// out: (na,) output
void min_cross_distances(const double *A, const double *B,
                         std::size_t na, std::size_t nb, std::size_t d,
                         double *out);

}  // namespace rrf::dist
