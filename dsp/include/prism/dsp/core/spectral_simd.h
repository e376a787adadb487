// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk complex-bin math using Google Highway for runtime SIMD dispatch
// (SSE2/AVX2/AVX-512/NEON).
//
// All functions operate on interleaved {real, imag} double pairs, the layout
// shared by Complex arrays and the pffft ordered complex format.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Prism {
namespace DSP {

/// @brief Bulk compute magnitude and phase from interleaved complex data
/// @param complexData Pointer to interleaved {real, imag} double pairs
/// @param numBins Number of complex bins (NOT number of doubles)
/// @param mags Output magnitude array (must hold numBins doubles)
/// @param phases Output phase array in radians, [-pi, pi] (must hold numBins doubles)
/// @note SIMD-accelerated with runtime ISA dispatch
void computePolarBulk(const double* complexData, size_t numBins,
                      double* mags, double* phases) noexcept;

/// @brief In-place pointwise complex product: data[k] *= factors[k]
/// @param data Interleaved {real, imag} pairs, overwritten with the products
/// @param factors Interleaved {real, imag} pairs (must not alias data)
/// @param numBins Number of complex bins (NOT number of doubles)
/// @note SIMD-accelerated with runtime ISA dispatch
void multiplyComplexBulk(double* data, const double* factors,
                         size_t numBins) noexcept;

} // namespace DSP
} // namespace Prism
