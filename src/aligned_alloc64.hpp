#pragma once
#include "constants.hpp"

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <new>

#if defined(_MSC_VER)
    #include <malloc.h>
#endif

namespace rrf {

// Aligned allocation for double[]; release with aligned_free_64
inline double *aligned_alloc_64(std::size_t nelems) {
    if (nelems == 0)
        nelems = 1;
#if defined(_MSC_VER)
    void *p = _aligned_malloc(nelems * sizeof(double), ALIGNMENT_BYTES);
    if (!p)
        throw std::bad_alloc();
    return static_cast<double *>(p);
#else
    void *p = nullptr;
    if (posix_memalign(&p, ALIGNMENT_BYTES, nelems * sizeof(double)) != 0) {
        throw std::bad_alloc();
    }
    return static_cast<double *>(p);
#endif
}

inline void aligned_free_64(void *p) {
#if defined(_MSC_VER)
    _aligned_free(p);
#else
    std::free(p);
#endif
}

struct AlignedDeleter {
    void operator()(double *p) const { aligned_free_64(p); }
};

// Scratch buffer that is released on every exit path
using AlignedBuffer = std::unique_ptr<double[], AlignedDeleter>;

inline AlignedBuffer make_aligned_buffer(std::size_t nelems) {
    return AlignedBuffer(aligned_alloc_64(nelems));
}

}  // namespace rrf
