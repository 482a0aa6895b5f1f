#pragma once

#include <cstddef>
#include <random>

namespace rrf::relu {

// Draw random ReLU directions uniformly on the unit sphere in d+1 dimensions:
//   W[r, c] ~ N(0, 1), drawn in row-major order,
//   then every column c is scaled to ||W[:, c]|| = 1.
// Row 0 multiplies the bias coordinate, rows 1..d the input features.
//
// rng: advanced by (d+1)*D draws (plus redraws of zero columns, which
//      occur with probability zero)
// W:   (d+1, D) row-major output
void sample_relu_weights(std::size_t d, std::size_t D, std::mt19937_64 &rng, double *W);

}  // namespace rrf::relu
