#pragma once

#include <cstddef>

namespace rrf::relu {

// Compute random ReLU features:
//   Z[i, c] = max(0, (1/gamma) * W[0, c] + sum_k X[i, k] * W[k+1, c])
//
// X:     (N, d) row-major - input features
// W:     (d+1, D) row-major - unit-norm directions, row 0 is the bias row
// gamma: kernel scale, > 0
// Z:     (N, D) row-major output, every entry >= 0
void relu_features(const double *X, const double *W, double gamma,
                   std::size_t N, std::size_t d, std::size_t D,
                   double *Z);

}  // namespace rrf::relu
