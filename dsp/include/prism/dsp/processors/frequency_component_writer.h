// ==============================================================================
// Layer 2: DSP Processor - Frequency Component Writer
// ==============================================================================
// Places one sinusoid, amplitude * cos(2*pi*freq*t + phase), into a spectrum.
//
// The coefficient is pre-scaled by N so that the 1/N of the inverse transform
// yields the requested time-domain amplitude. For freq != 0 the energy is
// split evenly between bin k and its mirror N - k as a conjugate pair, which
// keeps the inverse transform real. DC has a single bin and takes the whole
// coefficient.
//
// Writes add to whatever the bins already hold. Because each write adds a
// conjugate pair, the pairing bins[i] == conj(bins[N - i]) is preserved; on
// the Nyquist bin (even N) both halves land in the same bin and sum to a
// purely real value.
//
// Frequencies are quantized to the nearest bin. Bins beyond N/2 alias to a
// different apparent frequency; that is expected behaviour, not an error.
// ==============================================================================

#pragma once

#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/math_constants.h>
#include <prism/dsp/core/signal_errors.h>
#include <prism/dsp/primitives/spectrum_buffer.h>

#include <cmath>
#include <cstddef>

namespace Prism {
namespace DSP {

/// @brief Add a sinusoidal component to a spectrum
///
/// @param spectrum Target spectrum (modified in place)
/// @param freq Frequency in Hz; 0 writes the DC bin
/// @param amplitude Peak amplitude of the time-domain sinusoid
/// @param phaseDegrees Phase offset in degrees (cosine reference)
/// @throws DomainError if any argument is NaN or infinite (spectrum untouched)
///
/// @example
/// @code
/// SpectrumBuffer spectrum(1.0, 8.0);                  // N = 8
/// writeFrequencyComponent(spectrum, 2.0, 1.0);        // bins 2 and 6 = 2 + 0i
/// @endcode
inline void writeFrequencyComponent(SpectrumBuffer& spectrum, double freq,
                                    double amplitude, double phaseDegrees = 0.0) {
    if (!std::isfinite(freq) || !std::isfinite(amplitude) || !std::isfinite(phaseDegrees)) {
        throw DomainError("frequency component parameters must be finite");
    }

    const double n = static_cast<double>(spectrum.size());
    const double phase = phaseDegrees * kDegreesToRadians;

    double re = n * amplitude * std::cos(phase);
    double im = n * amplitude * std::sin(phase);

    if (freq == 0.0) {
        spectrum[0] += Complex{re, im};
        return;
    }

    // Positive and negative frequency share the energy
    re *= 0.5;
    im *= 0.5;

    if (std::abs(spectrum.frequencyToBinPosition(freq)) > n * 0.5) {
        logger()->trace("write: {} Hz lies beyond Nyquist ({} Hz) and aliases",
                        freq, spectrum.config().nyquist());
    }

    const size_t index = spectrum.frequencyToBin(freq);
    const size_t mirror = spectrum.mirrorBin(index);

    spectrum[index] += Complex{re, im};
    spectrum[mirror] += Complex{re, -im};
}

} // namespace DSP
} // namespace Prism
