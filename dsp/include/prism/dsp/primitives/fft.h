// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Double-precision complex DFT of any length, backed by pffft (Pretty Fast
// FFT). Provides forward (unscaled) and inverse (1/N scaled) transforms.
//
// pffft only accepts lengths of the form 2^a * 3^b * 5^c that are multiples
// of its SIMD granularity. Other lengths are evaluated with Bluestein's
// chirp-z algorithm: the DFT is rewritten as a convolution with a quadratic
// chirp, and the convolution runs through a power-of-two pffft transform.
// Either way the cost is O(N log N).
//
// Backend: pffft (marton78 fork, BSD license), double-precision API
// ==============================================================================

#pragma once

#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/math_constants.h>
#include <prism/dsp/core/spectral_simd.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <pffft_double.h>

namespace Prism {
namespace DSP {

// =============================================================================
// Forward Declarations
// =============================================================================

struct Complex;
class FFT;

// =============================================================================
// Constants
// =============================================================================

/// Smallest convolution length used for chirp-z transforms
inline constexpr size_t kMinChirpConvolutionSize = 64;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for spectral operations
/// @note POD type, layout-compatible with interleaved {real, imag} doubles
struct Complex {
    double real = 0.0;  ///< Real component
    double imag = 0.0;  ///< Imaginary component

    // -------------------------------------------------------------------------
    // Arithmetic Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    [[nodiscard]] constexpr Complex operator*(double scale) const noexcept {
        return {real * scale, imag * scale};
    }

    constexpr Complex& operator+=(const Complex& other) noexcept {
        real += other.real;
        imag += other.imag;
        return *this;
    }

    [[nodiscard]] constexpr bool operator==(const Complex& other) const noexcept = default;

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    // -------------------------------------------------------------------------
    // Polar Representation
    // -------------------------------------------------------------------------

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] double magnitude() const noexcept {
        return std::hypot(real, imag);
    }

    /// @brief Get phase angle in radians
    [[nodiscard]] double phase() const noexcept {
        return std::atan2(imag, real);
    }

    /// @brief Build from magnitude and phase (radians)
    [[nodiscard]] static Complex fromPolar(double magnitude, double phase) noexcept {
        return {magnitude * std::cos(phase), magnitude * std::sin(phase)};
    }
};

static_assert(sizeof(Complex) == 2 * sizeof(double),
              "Complex must be layout-compatible with interleaved doubles");

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFTD_Setup* s) const noexcept {
        if (s) pffftd_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffftd_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<double, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned, zeroed double buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numDoubles) {
    AlignedBuffer buffer{static_cast<double*>(pffftd_aligned_malloc(numDoubles * sizeof(double)))};
    if (buffer) std::fill_n(buffer.get(), numDoubles, 0.0);
    return buffer;
}

/// True if pffft can transform this length directly: a multiple of the
/// squared SIMD width whose only prime factors are 2, 3 and 5
[[nodiscard]] inline bool isDirectLength(size_t size) noexcept {
    const auto simd = static_cast<size_t>(pffftd_simd_size());
    if (size == 0 || size % (simd * simd) != 0) return false;
    size_t remaining = size;
    for (size_t factor : {2, 3, 5}) {
        while (remaining % factor == 0) remaining /= factor;
    }
    return remaining == 1;
}

/// n^2 mod 2N, the exact chirp phase index for Bluestein's algorithm
[[nodiscard]] constexpr uint64_t chirpIndex(uint64_t n, uint64_t size) noexcept {
    const uint64_t period = 2 * size;
    const uint64_t r = n % period;
    return (r * r) % period;
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Complex DFT of arbitrary length (SIMD-accelerated via pffft)
///
/// Conventions:
///   forward: X[k] = sum_n x[n] * exp(-2*pi*i*k*n/N)
///   inverse: x[n] = (1/N) * sum_k X[k] * exp(+2*pi*i*k*n/N)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare for transforms of the given length
    /// @param size Transform length, 1 or more (any factorization)
    /// @note Allocates; isPrepared() is false afterwards if the backend
    ///       could not be set up
    void prepare(size_t size) {
        release();
        if (size == 0) return;

        // Direct pffft transform when the length is acceptable to the backend
        if (detail::isDirectLength(size)) {
            setup_.reset(pffftd_new_setup(static_cast<int>(size), PFFFT_COMPLEX));
        }
        if (setup_) {
            transformSize_ = size;
            if (!allocateBuffers()) {
                release();
                return;
            }
            size_ = size;
            logger()->debug("fft: direct pffft plan, N={}", size);
            return;
        }

        // Bluestein: convolution length M >= 2N-1, power of two
        const size_t convSize = std::max(std::bit_ceil(2 * size - 1), kMinChirpConvolutionSize);
        setup_.reset(pffftd_new_setup(static_cast<int>(convSize), PFFFT_COMPLEX));
        if (!setup_) {
            logger()->error("fft: pffft rejected chirp-z convolution length {}", convSize);
            return;
        }
        transformSize_ = convSize;
        if (!allocateBuffers()) {
            release();
            return;
        }
        size_ = size;
        prepareChirp();
        logger()->debug("fft: chirp-z plan, N={} via convolution length {}", size, convSize);
    }

    /// @brief Clear internal work buffers
    void reset() noexcept {
        const size_t len = 2 * transformSize_;
        if (buf1_) std::fill_n(buf1_.get(), len, 0.0);
        if (buf2_) std::fill_n(buf2_.get(), len, 0.0);
        if (work_) std::fill_n(work_.get(), len, 0.0);
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward DFT (unscaled)
    /// @param input N complex samples
    /// @param output N complex bins (may alias input)
    /// @pre prepare() has been called
    void forward(const Complex* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;
        transform(input, output, PFFFT_FORWARD, 1.0);
    }

    /// @brief Inverse DFT, scaled by 1/N so that inverse(forward(x)) == x
    /// @param input N complex bins
    /// @param output N complex samples (may alias input)
    /// @pre prepare() has been called
    void inverse(const Complex* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;
        transform(input, output, PFFFT_BACKWARD, 1.0 / static_cast<double>(size_));
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured transform length
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

    /// @brief True if the length is evaluated with the chirp-z algorithm
    [[nodiscard]] bool usesChirpZ() const noexcept { return isPrepared() && transformSize_ != size_; }

    /// @brief Length of the underlying pffft transform (N, or the chirp-z
    ///        convolution length)
    [[nodiscard]] size_t transformSize() const noexcept { return transformSize_; }

private:
    bool allocateBuffers() {
        const size_t len = 2 * transformSize_;
        buf1_ = detail::makeAlignedBuffer(len);
        buf2_ = detail::makeAlignedBuffer(len);
        work_ = detail::makeAlignedBuffer(len);
        return buf1_ && buf2_ && work_;
    }

    void release() noexcept {
        setup_.reset();
        buf1_.reset();
        buf2_.reset();
        work_.reset();
        chirp_.clear();
        chirpFilterForward_.clear();
        chirpFilterInverse_.clear();
        size_ = 0;
        transformSize_ = 0;
    }

    /// Precompute w[n] = exp(-i*pi*n^2/N) and the transformed convolution
    /// filters for both directions.
    void prepareChirp() {
        const size_t N = size_;
        const size_t M = transformSize_;

        chirp_.resize(N);
        for (size_t n = 0; n < N; ++n) {
            const double angle = kPi * static_cast<double>(detail::chirpIndex(n, N))
                               / static_cast<double>(N);
            chirp_[n] = {std::cos(angle), -std::sin(angle)};
        }

        // Forward filter b[n] = conj(w[n]), inverse filter b[n] = w[n],
        // both wrapped circularly: b[M-n] = b[n]
        auto buildFilter = [&](std::vector<double>& filter, bool conjugateChirp) {
            double* b = buf1_.get();
            std::fill_n(b, 2 * M, 0.0);
            for (size_t n = 0; n < N; ++n) {
                const Complex value = conjugateChirp ? chirp_[n].conjugate() : chirp_[n];
                b[2 * n] = value.real;
                b[2 * n + 1] = value.imag;
                if (n > 0) {
                    b[2 * (M - n)] = value.real;
                    b[2 * (M - n) + 1] = value.imag;
                }
            }
            pffftd_transform_ordered(setup_.get(), b, buf2_.get(),
                                     work_.get(), PFFFT_FORWARD);
            filter.assign(buf2_.get(), buf2_.get() + 2 * M);
        };

        buildFilter(chirpFilterForward_, true);
        buildFilter(chirpFilterInverse_, false);
    }

    void transform(const Complex* input, Complex* output,
                   pffft_direction_t direction, double scale) noexcept {
        if (usesChirpZ()) {
            transformChirpZ(input, output, direction, scale);
        } else {
            transformDirect(input, output, direction, scale);
        }
    }

    void transformDirect(const Complex* input, Complex* output,
                         pffft_direction_t direction, double scale) noexcept {
        const size_t N = size_;

        double* in = buf1_.get();
        for (size_t n = 0; n < N; ++n) {
            in[2 * n] = input[n].real;
            in[2 * n + 1] = input[n].imag;
        }
        pffftd_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                 work_.get(), direction);

        const double* out = buf2_.get();
        for (size_t k = 0; k < N; ++k) {
            output[k] = {out[2 * k] * scale, out[2 * k + 1] * scale};
        }
    }

    void transformChirpZ(const Complex* input, Complex* output,
                         pffft_direction_t direction, double scale) noexcept {
        const size_t N = size_;
        const size_t M = transformSize_;
        const bool isForward = (direction == PFFFT_FORWARD);
        const std::vector<double>& filter = isForward ? chirpFilterForward_ : chirpFilterInverse_;

        // a[n] = x[n] * w[n] (w conjugated for the inverse direction), zero padded
        double* a = buf1_.get();
        for (size_t n = 0; n < N; ++n) {
            const Complex w = isForward ? chirp_[n] : chirp_[n].conjugate();
            const Complex v = input[n] * w;
            a[2 * n] = v.real;
            a[2 * n + 1] = v.imag;
        }
        std::fill(a + 2 * N, a + 2 * M, 0.0);

        // Circular convolution a * b via the length-M transform
        pffftd_transform_ordered(setup_.get(), a, buf2_.get(), work_.get(), PFFFT_FORWARD);
        multiplyComplexBulk(buf2_.get(), filter.data(), M);
        pffftd_transform_ordered(setup_.get(), buf2_.get(), a, work_.get(), PFFFT_BACKWARD);

        // X[k] = w[k] * conv[k] / M
        const double convScale = scale / static_cast<double>(M);
        for (size_t k = 0; k < N; ++k) {
            const Complex w = isForward ? chirp_[k] : chirp_[k].conjugate();
            const Complex c{a[2 * k], a[2 * k + 1]};
            output[k] = (c * w) * convScale;
        }
    }

    size_t size_ = 0;           // Logical transform length N
    size_t transformSize_ = 0;  // pffft length (N, or chirp-z convolution length)
    std::unique_ptr<PFFFTD_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer buf1_;  // Input staging
    detail::AlignedBuffer buf2_;  // Output staging
    detail::AlignedBuffer work_;  // pffft work buffer

    std::vector<Complex> chirp_;               // w[n] = exp(-i*pi*n^2/N)
    std::vector<double> chirpFilterForward_;   // FFT of conj(w), wrapped, interleaved
    std::vector<double> chirpFilterInverse_;   // FFT of w, wrapped, interleaved
};

} // namespace DSP
} // namespace Prism
