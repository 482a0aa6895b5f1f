#pragma once
#include <cstddef>

namespace rrf {

// ---- Memory alignment ----
// SIMD/cache alignment for buffers handed to NumPy
constexpr std::size_t ALIGNMENT_BYTES = 64;

// ---- BLAS tiling ----
// Query rows per distance tile in the neighbour search
constexpr std::size_t DEFAULT_TILE_SIZE = 256;

// ---- Feature map defaults ----
constexpr std::size_t DEFAULT_N_COMPONENTS = 300;

// Neighbour rank used by the "avg_ann_50" heuristic
constexpr std::size_t DEFAULT_NEIGHBOUR_RANK = 50;

}  // namespace rrf
