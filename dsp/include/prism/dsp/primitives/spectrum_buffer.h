// ==============================================================================
// Layer 1: DSP Primitive - Spectrum Buffer
// ==============================================================================
// Fixed-length array of N complex frequency-domain coefficients, indexed by
// discrete frequency bin. N = floor(duration * sampleRate) is fixed at
// construction; every bin starts at zero (silence).
//
// Bin layout:
//   bin 0              DC (no mirror)
//   bin i, 0 < i < N/2 frequency i * sampleRate / N
//   bin N/2 (even N)   Nyquist, its own mirror
//   bin N - i          negative-frequency image of bin i
//
// A real-valued time-domain signal needs bins[i] == conj(bins[N - i]) for
// every i != 0. The writers in processors/ maintain that pairing; the buffer
// itself stores whatever it is given and can report whether it holds.
// ==============================================================================

#pragma once

#include <prism/dsp/core/signal_config.h>
#include <prism/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace Prism {
namespace DSP {

/// @brief Owned, fixed-size buffer of complex spectrum bins
///
/// Value type: copying a SpectrumBuffer clones its bins.
class SpectrumBuffer {
public:
    /// @brief Create a silent spectrum for the given layout
    /// @throws ConfigurationError if the layout is not usable
    explicit SpectrumBuffer(const SignalConfig& config)
        : config_(validated(config))
        , bins_(config_.binCount()) {}

    /// @brief Create a silent spectrum of duration seconds at sampleRate Hz
    /// @throws ConfigurationError if either is non-positive or N is zero
    SpectrumBuffer(double duration, double sampleRate)
        : SpectrumBuffer(SignalConfig{duration, sampleRate}) {}

    // -------------------------------------------------------------------------
    // Layout
    // -------------------------------------------------------------------------

    /// @brief Number of bins N (also the time-domain sample count)
    [[nodiscard]] size_t size() const noexcept { return bins_.size(); }

    [[nodiscard]] double duration() const noexcept { return config_.duration; }
    [[nodiscard]] double sampleRate() const noexcept { return config_.sampleRate; }
    [[nodiscard]] const SignalConfig& config() const noexcept { return config_; }

    /// @brief Frequency label of a bin: bin * sampleRate / N
    /// @note Bins above N/2 get labels above Nyquist; they are the
    ///       negative-frequency images of bin N - i.
    [[nodiscard]] double binToFrequency(size_t bin) const noexcept {
        return static_cast<double>(bin) * config_.sampleRate / static_cast<double>(size());
    }

    /// @brief Unwrapped nearest-bin position: round(freq * N / sampleRate)
    /// @note Positions outside [-N/2, N/2] belong to frequencies that alias.
    [[nodiscard]] double frequencyToBinPosition(double freq) const noexcept {
        return std::round(freq * static_cast<double>(size()) / config_.sampleRate);
    }

    /// @brief Nearest bin for a frequency, wrapped onto [0, N)
    ///
    /// The spectrum is periodic in the sample rate, so a frequency beyond the
    /// sample rate (or below zero) lands on the bin of its alias.
    [[nodiscard]] size_t frequencyToBin(double freq) const noexcept {
        const double n = static_cast<double>(size());
        double wrapped = std::fmod(frequencyToBinPosition(freq), n);
        if (wrapped < 0.0) wrapped += n;
        return static_cast<size_t>(wrapped);
    }

    /// @brief Index of the conjugate partner of a bin (DC maps to itself)
    [[nodiscard]] size_t mirrorBin(size_t bin) const noexcept {
        return bin == 0 ? 0 : size() - bin;
    }

    /// @brief Number of non-negative frequency bins, ceil((N + 1) / 2)
    [[nodiscard]] size_t numPositiveBins() const noexcept {
        return size() / 2 + 1;
    }

    // -------------------------------------------------------------------------
    // Bin Access
    // -------------------------------------------------------------------------

    [[nodiscard]] Complex& operator[](size_t bin) noexcept { return bins_[bin]; }
    [[nodiscard]] const Complex& operator[](size_t bin) const noexcept { return bins_[bin]; }

    /// @brief Bounds-checked bin access
    /// @throws std::out_of_range if bin >= N
    [[nodiscard]] Complex& at(size_t bin) { return bins_.at(bin); }
    [[nodiscard]] const Complex& at(size_t bin) const { return bins_.at(bin); }

    /// @brief Read a bin, returning zero when out of range
    [[nodiscard]] Complex getBin(size_t bin) const noexcept {
        return bin < bins_.size() ? bins_[bin] : Complex{};
    }

    /// @brief Write a bin; out-of-range writes are ignored
    void setBin(size_t bin, const Complex& value) noexcept {
        if (bin < bins_.size()) bins_[bin] = value;
    }

    [[nodiscard]] Complex* data() noexcept { return bins_.data(); }
    [[nodiscard]] const Complex* data() const noexcept { return bins_.data(); }

    /// @brief Bins as interleaved {real, imag} doubles (2 * size() values)
    /// @note Complex is layout-compatible with two doubles (see fft.h), which
    ///       is the format the SIMD kernels in spectral_simd.h consume.
    [[nodiscard]] const double* interleavedData() const noexcept {
        return reinterpret_cast<const double*>(bins_.data());
    }

    [[nodiscard]] auto begin() noexcept { return bins_.begin(); }
    [[nodiscard]] auto end() noexcept { return bins_.end(); }
    [[nodiscard]] auto begin() const noexcept { return bins_.begin(); }
    [[nodiscard]] auto end() const noexcept { return bins_.end(); }

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    /// @brief Zero every bin (silence)
    void reset() noexcept {
        std::fill(bins_.begin(), bins_.end(), Complex{});
    }

    /// @brief True if every bin is exactly zero
    [[nodiscard]] bool isSilent() const noexcept {
        return std::all_of(bins_.begin(), bins_.end(),
                           [](const Complex& c) { return c.real == 0.0 && c.imag == 0.0; });
    }

    /// @brief Check bins[i] == conj(bins[N - i]) for every i != 0
    /// @param tolerance Absolute tolerance per component
    [[nodiscard]] bool isConjugateSymmetric(double tolerance = 0.0) const noexcept {
        const size_t n = size();
        for (size_t i = 1; i < n; ++i) {
            const Complex& a = bins_[i];
            const Complex b = bins_[n - i].conjugate();
            if (std::abs(a.real - b.real) > tolerance || std::abs(a.imag - b.imag) > tolerance) {
                return false;
            }
        }
        return true;
    }

private:
    static const SignalConfig& validated(const SignalConfig& config) {
        config.validate();
        return config;
    }

    SignalConfig config_;
    std::vector<Complex> bins_;
};

} // namespace DSP
} // namespace Prism
