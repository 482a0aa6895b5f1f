#pragma once
#include <cstdint>

// BLAS backend selection:
//   - __APPLE__:    Accelerate.framework
//   - RRF_USE_MKL:  Intel MKL
//   - otherwise:    generic CBLAS (OpenBLAS, reference BLAS)
//
// RRF_BLAS_ILP64 switches every backend to 64-bit integers. The backend
// specific ILP64 macro must be set before its header is included.

#if defined(__APPLE__)
    #ifdef RRF_BLAS_ILP64
        #define ACCELERATE_BLAS_ILP64
    #endif
    #include <Accelerate/Accelerate.h>

#elif defined(RRF_USE_MKL)
    #ifdef RRF_BLAS_ILP64
        #define MKL_ILP64
    #endif
    #include <mkl.h>

#else
    #ifdef RRF_BLAS_ILP64
        #define OPENBLAS_USE64BITINT
    #endif
    #include <cblas.h>

#endif

// Integer type passed to CBLAS dimension and leading-dimension arguments
#ifdef RRF_BLAS_ILP64
    #if defined(__APPLE__)
        using blas_int = long;
    #else
        using blas_int = std::int64_t;
    #endif
#else
    using blas_int = int;
#endif
