// ==============================================================================
// Layer 2: DSP Processor - Domain Converter
// ==============================================================================
// Read-only projections of a spectrum, recomputed on every call:
//
// - toTimeDomain():      real part of the inverse DFT, on a time axis of N
//                        evenly spaced points over [0, duration]
// - toFrequencyDomain(): single-sided view, bins 0..N/2 with amplitudes
//                        rescaled to the sinusoid amplitudes that were
//                        written (|X| / N, doubled for every bin except DC
//                        and, for even N, Nyquist) and phases in degrees,
//                        (-180, 180]
//
// sampleTimeFunction() goes the other way: it samples a function of time
// and replaces the spectrum with its forward DFT.
// ==============================================================================

#pragma once

#include <prism/dsp/core/db_utils.h>
#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/math_constants.h>
#include <prism/dsp/core/spectral_simd.h>
#include <prism/dsp/primitives/fft.h>
#include <prism/dsp/primitives/spectrum_buffer.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace Prism {
namespace DSP {

// =============================================================================
// Views
// =============================================================================

/// @brief Time-domain projection: sample values against time in seconds
struct TimeDomainView {
    std::vector<double> time;     ///< N points, 0 to duration inclusive
    std::vector<double> samples;  ///< Real part of the inverse DFT

    [[nodiscard]] size_t size() const noexcept { return samples.size(); }
};

/// @brief Single-sided frequency-domain projection
struct FrequencyDomainView {
    std::vector<double> frequencies;    ///< Bin frequencies, 0 up to Nyquist
    std::vector<double> magnitudes;     ///< Unilateral sinusoid amplitudes
    std::vector<double> phasesDegrees;  ///< atan2(imag, real) in (-180, 180]

    [[nodiscard]] size_t size() const noexcept { return magnitudes.size(); }

    /// @brief Magnitudes in decibels (20*log10), silence floored at kSilenceFloorDb
    [[nodiscard]] std::vector<double> magnitudesDb() const {
        std::vector<double> db(magnitudes.size());
        for (size_t i = 0; i < magnitudes.size(); ++i) {
            db[i] = gainToDb(magnitudes[i]);
        }
        return db;
    }
};

namespace detail {

inline FFT makePreparedFFT(size_t size) {
    FFT fft;
    fft.prepare(size);
    if (!fft.isPrepared()) {
        throw std::runtime_error("FFT backend could not be prepared for "
                                 + std::to_string(size) + " points");
    }
    return fft;
}

/// Fold a phase in degrees from [-180, 180] onto (-180, 180]
[[nodiscard]] constexpr double foldPhaseDegrees(double degrees) noexcept {
    return degrees <= -180.0 ? degrees + 360.0 : degrees;
}

} // namespace detail

// =============================================================================
// Conversions
// =============================================================================

/// @brief Real time-domain samples of a spectrum
/// @throws std::runtime_error if the FFT backend cannot be set up
[[nodiscard]] inline TimeDomainView toTimeDomain(const SpectrumBuffer& spectrum) {
    const size_t n = spectrum.size();

    TimeDomainView view;
    view.time.resize(n);
    view.samples.resize(n);

    // Same spacing as an inclusive linspace(0, duration, N)
    if (n == 1) {
        view.time[0] = 0.0;
    } else {
        const double step = spectrum.duration() / static_cast<double>(n - 1);
        for (size_t i = 0; i < n; ++i) {
            view.time[i] = step * static_cast<double>(i);
        }
    }

    FFT fft = detail::makePreparedFFT(n);
    std::vector<Complex> timeDomain(n);
    fft.inverse(spectrum.data(), timeDomain.data());

    for (size_t i = 0; i < n; ++i) {
        view.samples[i] = timeDomain[i].real;
    }
    return view;
}

/// @brief Single-sided magnitude/phase view of a spectrum
[[nodiscard]] inline FrequencyDomainView toFrequencyDomain(const SpectrumBuffer& spectrum) {
    const size_t n = spectrum.size();
    const size_t numBins = spectrum.numPositiveBins();

    FrequencyDomainView view;
    view.frequencies.resize(numBins);
    view.magnitudes.resize(numBins);
    view.phasesDegrees.resize(numBins);

    computePolarBulk(spectrum.interleavedData(), numBins,
                     view.magnitudes.data(), view.phasesDegrees.data());

    const double invN = 1.0 / static_cast<double>(n);
    for (size_t i = 0; i < numBins; ++i) {
        view.frequencies[i] = spectrum.binToFrequency(i);

        // Bins other than DC and Nyquist hold half of a conjugate pair;
        // those two are their own mirror and already hold the whole component
        const bool selfMirrored = (i == 0) || (2 * i == n);
        const double scale = selfMirrored ? invN : 2.0 * invN;
        view.magnitudes[i] *= scale;
        view.phasesDegrees[i] = detail::foldPhaseDegrees(view.phasesDegrees[i] * kRadiansToDegrees);
    }
    return view;
}

/// @brief Replace the spectrum with the DFT of func sampled over the signal
///
/// Sample n is taken at t = n / sampleRate, n in [0, N), so toTimeDomain()
/// afterwards reproduces the sampled values.
///
/// @param spectrum Target spectrum (overwritten)
/// @param func Callable double(double timeSeconds)
template <typename TimeFunction>
void sampleTimeFunction(SpectrumBuffer& spectrum, TimeFunction&& func) {
    const size_t n = spectrum.size();
    FFT fft = detail::makePreparedFFT(n);

    std::vector<Complex> samples(n);
    const double sampleRate = spectrum.sampleRate();
    for (size_t i = 0; i < n; ++i) {
        samples[i] = Complex{static_cast<double>(func(static_cast<double>(i) / sampleRate)), 0.0};
    }

    fft.forward(samples.data(), spectrum.data());
    logger()->debug("sampled time function into {} bins", n);
}

} // namespace DSP
} // namespace Prism
