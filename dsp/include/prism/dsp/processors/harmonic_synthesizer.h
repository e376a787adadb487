// ==============================================================================
// Layer 2: DSP Processor - Harmonic Synthesizer
// ==============================================================================
// Band-limited square wave as a truncated Fourier series:
//
//   x(t) = sum over odd h with h*f <= fLimit of (1 / (h*f)) * cos(2*pi*h*f*t - 90deg)
//
// Odd harmonics only, amplitude inversely proportional to the harmonic
// frequency, sine phase. The whole spectrum is replaced: it is cleared first
// and then every harmonic is written through writeFrequencyComponent().
// ==============================================================================

#pragma once

#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/signal_config.h>
#include <prism/dsp/core/signal_errors.h>
#include <prism/dsp/primitives/spectrum_buffer.h>
#include <prism/dsp/processors/frequency_component_writer.h>

#include <cmath>
#include <cstddef>
#include <string>

namespace Prism {
namespace DSP {

/// @brief Phase (degrees) used for every square-wave harmonic
inline constexpr double kSquareWavePhaseDegrees = -90.0;

/// @brief Largest number of harmonics a single synthesis call may write
inline constexpr size_t kMaxHarmonicCount = kMaxBinCount;

/// @brief Replace the spectrum with a band-limited square wave
///
/// @param spectrum Target spectrum (overwritten)
/// @param freq Fundamental frequency in Hz, must be > 0
/// @param fLimit Highest harmonic frequency to include (inclusive)
/// @return Number of harmonics written (0 if freq > fLimit)
/// @throws DomainError if freq <= 0, either argument is not finite, or the
///         series would need more than kMaxHarmonicCount terms. Thrown before
///         the spectrum is touched.
inline size_t synthesizeSquareWave(SpectrumBuffer& spectrum, double freq,
                                   double fLimit = kDefaultHarmonicLimitHz) {
    if (!std::isfinite(freq) || freq <= 0.0) {
        throw DomainError("square wave fundamental must be a positive frequency, got "
                          + std::to_string(freq));
    }
    if (!std::isfinite(fLimit)) {
        throw DomainError("square wave harmonic limit must be finite");
    }
    if ((fLimit / freq + 1.0) * 0.5 > static_cast<double>(kMaxHarmonicCount)) {
        throw DomainError("square wave of " + std::to_string(freq) + " Hz up to "
                          + std::to_string(fLimit) + " Hz needs too many harmonics");
    }

    spectrum.reset();

    size_t written = 0;
    for (size_t harmonic = 1;; harmonic += 2) {
        const double f = freq * static_cast<double>(harmonic);
        if (f > fLimit) break;
        writeFrequencyComponent(spectrum, f, 1.0 / f, kSquareWavePhaseDegrees);
        ++written;
    }

    logger()->debug("square wave: {} Hz, {} odd harmonics up to {} Hz", freq, written, fLimit);
    return written;
}

} // namespace DSP
} // namespace Prism
