// ==============================================================================
// Layer 2: DSP Processor - Band Clearer
// ==============================================================================
// Zeroes the bins whose frequency label satisfies a predicate.
//
// Each bin i is labelled i * sampleRate / N, so bins above N/2 carry labels
// above Nyquist rather than negative frequencies. A predicate that only
// matches a positive-frequency band leaves the mirror bins alone; use
// MirroredBand (or an equivalent predicate) to clear both halves.
// ==============================================================================

#pragma once

#include <prism/dsp/primitives/spectrum_buffer.h>

#include <cstddef>

namespace Prism {
namespace DSP {

// =============================================================================
// Predicates
// =============================================================================

/// @brief Closed frequency interval [lowHz, highHz]
struct FrequencyBand {
    double lowHz = 0.0;
    double highHz = 0.0;

    [[nodiscard]] constexpr bool operator()(double freq) const noexcept {
        return freq >= lowHz && freq <= highHz;
    }
};

/// @brief A band together with its negative-frequency image
///
/// Matches f when f or (sampleRate - f) falls inside the band, so clearing
/// with it keeps conjugate pairs intact.
struct MirroredBand {
    FrequencyBand band;
    double sampleRate = 0.0;

    [[nodiscard]] constexpr bool operator()(double freq) const noexcept {
        return band(freq) || (freq > 0.0 && band(sampleRate - freq));
    }
};

// =============================================================================
// Clearing
// =============================================================================

/// @brief Zero every bin whose frequency label satisfies the predicate
///
/// @param spectrum Target spectrum (modified in place)
/// @param predicate Callable bool(double freqHz)
/// @return Number of bins cleared
template <typename Predicate>
size_t clearBand(SpectrumBuffer& spectrum, Predicate&& predicate) {
    size_t cleared = 0;
    for (size_t i = 0; i < spectrum.size(); ++i) {
        if (predicate(spectrum.binToFrequency(i))) {
            spectrum[i] = Complex{};
            ++cleared;
        }
    }
    return cleared;
}

/// @brief Zero every bin (silence)
inline size_t clearBand(SpectrumBuffer& spectrum) noexcept {
    spectrum.reset();
    return spectrum.size();
}

} // namespace DSP
} // namespace Prism
