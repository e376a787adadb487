// ==============================================================================
// Layer 2: DSP Processor - Spectrum Transforms
// ==============================================================================
// Whole-spectrum edits that combine or move existing content:
//
// - mixSpectrum():     superposition, dest += src bin by bin
// - shiftFrequency():  move every positive-frequency component by a fixed
//                      number of bins and rebuild the conjugate mirror
// ==============================================================================

#pragma once

#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/signal_errors.h>
#include <prism/dsp/primitives/spectrum_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Prism {
namespace DSP {

/// @brief Add another spectrum into this one (time-domain sum of both signals)
/// @throws ConfigurationError if the bin counts or sample rates differ
inline void mixSpectrum(SpectrumBuffer& dest, const SpectrumBuffer& src) {
    if (dest.size() != src.size() || dest.sampleRate() != src.sampleRate()) {
        throw ConfigurationError("cannot mix spectra with different layouts ("
                                 + std::to_string(dest.size()) + " bins at "
                                 + std::to_string(dest.sampleRate()) + " Hz vs "
                                 + std::to_string(src.size()) + " bins at "
                                 + std::to_string(src.sampleRate()) + " Hz)");
    }
    for (size_t i = 0; i < dest.size(); ++i) {
        dest[i] += src[i];
    }
}

/// @brief Shift every positive-frequency component by deltaHz
///
/// The shift is quantized to round(deltaHz * N / sampleRate) bins. The bins
/// 1..N/2 are taken as the content of the signal (a Nyquist bin contributes
/// half its value, the other half being its own mirror); each moves to its
/// new bin together with a rebuilt conjugate partner. DC is left in place.
/// Components that would land at or below DC, or at or above Nyquist, are
/// dropped.
///
/// @return Number of non-zero components dropped
/// @throws DomainError if deltaHz is not finite (spectrum untouched)
inline size_t shiftFrequency(SpectrumBuffer& spectrum, double deltaHz) {
    if (!std::isfinite(deltaHz)) {
        throw DomainError("frequency shift must be finite");
    }

    const size_t n = spectrum.size();
    const double position = spectrum.frequencyToBinPosition(deltaHz);
    if (position == 0.0) {
        return 0;
    }
    // Anything shifted by N bins or more leaves the usable band entirely
    const double limit = static_cast<double>(n);
    const auto shift = static_cast<int64_t>(std::clamp(position, -limit, limit));

    std::vector<Complex> shifted(n);
    shifted[0] = spectrum[0];

    size_t dropped = 0;
    for (size_t k = 1; 2 * k <= n; ++k) {
        Complex value = spectrum[k];
        if (value.real == 0.0 && value.imag == 0.0) continue;
        if (2 * k == n) value = value * 0.5;

        const int64_t target = static_cast<int64_t>(k) + shift;
        if (target < 1 || 2 * target >= static_cast<int64_t>(n)) {
            ++dropped;
            continue;
        }

        const auto dest = static_cast<size_t>(target);
        shifted[dest] += value;
        shifted[n - dest] += value.conjugate();
    }

    std::copy(shifted.begin(), shifted.end(), spectrum.begin());
    logger()->debug("shift: {} Hz ({} bins), {} components dropped", deltaHz, shift, dropped);
    return dropped;
}

} // namespace DSP
} // namespace Prism
