// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk polar conversion and complex multiplication using Google Highway for
// runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "prism/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Prism {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputePolarImpl: Complex[] -> mags[] + phases[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePolarImpl(const double* HWY_RESTRICT complexData, size_t numBins,
                      double* HWY_RESTRICT mags, double* HWY_RESTRICT phases) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        // Load interleaved [real0, imag0, real1, imag1, ...] into separate vectors
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        // Magnitude: sqrt(re^2 + im^2)
        const auto reSq = hn::Mul(re, re);
        const auto mag = hn::Sqrt(hn::MulAdd(im, im, reSq));

        // Phase: atan2(im, re)
        const auto phase = hn::Atan2(d, im, re);

        hn::StoreU(mag, d, mags + k);
        hn::StoreU(phase, d, phases + k);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        const double re = complexData[k * 2];
        const double im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
        phases[k] = std::atan2(im, re);
    }
}

// -----------------------------------------------------------------------------
// MultiplyComplexImpl: data[k] *= factors[k]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MultiplyComplexImpl(double* HWY_RESTRICT data,
                         const double* HWY_RESTRICT factors, size_t numBins) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> ar;
        hn::Vec<decltype(d)> ai;
        hn::Vec<decltype(d)> br;
        hn::Vec<decltype(d)> bi;
        hn::LoadInterleaved2(d, data + k * 2, ar, ai);
        hn::LoadInterleaved2(d, factors + k * 2, br, bi);

        // (ar + i*ai)(br + i*bi) = (ar*br - ai*bi) + i*(ar*bi + ai*br)
        const auto re = hn::MulSub(ar, br, hn::Mul(ai, bi));
        const auto im = hn::MulAdd(ar, bi, hn::Mul(ai, br));

        hn::StoreInterleaved2(re, im, d, data + k * 2);
    }

    // Scalar tail
    for (; k < numBins; ++k) {
        const double ar = data[k * 2];
        const double ai = data[k * 2 + 1];
        const double br = factors[k * 2];
        const double bi = factors[k * 2 + 1];
        data[k * 2] = ar * br - ai * bi;
        data[k * 2 + 1] = ar * bi + ai * br;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Prism
HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "prism/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Prism {
namespace DSP {

HWY_EXPORT(ComputePolarImpl);
HWY_EXPORT(MultiplyComplexImpl);

void computePolarBulk(const double* complexData, size_t numBins,
                      double* mags, double* phases) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePolarImpl)(complexData, numBins, mags, phases);
}

void multiplyComplexBulk(double* data, const double* factors,
                         size_t numBins) noexcept {
    HWY_DYNAMIC_DISPATCH(MultiplyComplexImpl)(data, factors, numBins);
}

}  // namespace DSP
}  // namespace Prism

#endif  // HWY_ONCE
