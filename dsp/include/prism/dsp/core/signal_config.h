// ==============================================================================
// Layer 0: Core Utility - SignalConfig
// ==============================================================================
// Layout of a discrete spectrum: how long the represented signal lasts and
// how densely it is sampled. Both determine the bin count N, which is fixed
// for the lifetime of a signal:
//
//   N = floor(duration * sampleRate)
//
// Bin i represents frequency i * sampleRate / N; the frequency resolution is
// therefore 1 / duration Hz.
// ==============================================================================

#pragma once

#include "signal_errors.h"

#include <cmath>
#include <cstddef>
#include <string>

namespace Prism {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default signal duration in seconds.
inline constexpr double kDefaultDuration = 1.0;

/// @brief Default sample rate in Hz.
inline constexpr double kDefaultSampleRate = 22050.0;

/// @brief Default upper harmonic limit for band-limited synthesis (Hz).
inline constexpr double kDefaultHarmonicLimitHz = 8000.0;

/// @brief Largest supported bin count.
/// Keeps every transform length (including the chirp-z convolution length,
/// up to 4N) inside the int range used by the FFT backend.
inline constexpr size_t kMaxBinCount = size_t{1} << 24;

// =============================================================================
// SignalConfig Struct
// =============================================================================

/// @brief Duration and sample rate of a discrete-spectrum signal.
///
/// @example
/// @code
/// SignalConfig config;
/// config.duration = 0.5;
/// config.sampleRate = 8000.0;
/// config.validate();            // throws ConfigurationError if unusable
/// size_t n = config.binCount(); // 4000
/// @endcode
struct SignalConfig {
    double duration = kDefaultDuration;      ///< Signal length in seconds
    double sampleRate = kDefaultSampleRate;  ///< Samples per second

    /// @brief Number of bins (and time-domain samples), floor(duration * rate).
    /// @return 0 for non-positive or non-finite layouts
    [[nodiscard]] size_t binCount() const noexcept {
        const double product = duration * sampleRate;
        if (!std::isfinite(product) || product < 1.0) {
            return 0;
        }
        if (product >= static_cast<double>(kMaxBinCount) + 1.0) {
            return kMaxBinCount + 1;
        }
        return static_cast<size_t>(std::floor(product));
    }

    /// @brief Frequency spacing between adjacent bins in Hz (sampleRate / N).
    [[nodiscard]] double binResolution() const noexcept {
        const size_t n = binCount();
        return n == 0 ? 0.0 : sampleRate / static_cast<double>(n);
    }

    /// @brief Highest representable frequency (sampleRate / 2).
    [[nodiscard]] double nyquist() const noexcept {
        return sampleRate * 0.5;
    }

    /// @brief Check that this layout describes a usable signal.
    /// @throws ConfigurationError on non-positive or non-finite duration or
    ///         sample rate, and when the bin count is 0 or above kMaxBinCount
    void validate() const {
        if (!std::isfinite(duration) || duration <= 0.0) {
            throw ConfigurationError("duration must be a positive number of seconds, got "
                                     + std::to_string(duration));
        }
        if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
            throw ConfigurationError("sample rate must be a positive number of Hz, got "
                                     + std::to_string(sampleRate));
        }
        const size_t n = binCount();
        if (n == 0) {
            throw ConfigurationError("duration * sample rate resolves to zero bins ("
                                     + std::to_string(duration) + " s at "
                                     + std::to_string(sampleRate) + " Hz)");
        }
        if (n > kMaxBinCount) {
            throw ConfigurationError("bin count exceeds the supported maximum of "
                                     + std::to_string(kMaxBinCount));
        }
    }
};

} // namespace DSP
} // namespace Prism
