// ==============================================================================
// Layer 3: System Component - Signal
// ==============================================================================
// A discrete-spectrum signal: one SpectrumBuffer plus the operations that
// write, clear, synthesize, combine and view it.
//
// Composes:
// - SpectrumBuffer (Layer 1): N complex bins, all zero at construction
// - writeFrequencyComponent, clearBand, synthesizeSquareWave,
//   shiftFrequency, mixSpectrum (Layer 2): in-place mutators
// - toTimeDomain, toFrequencyDomain, sampleTimeFunction (Layer 2): domain
//   conversion
//
// Value semantics: copying a Signal clones its spectrum.
//
// Thread safety: independent instances may be used from different threads;
// a single instance must not be used concurrently.
//
// @example
// @code
// Signal s(1.0, 1000.0);
// s.squareWave(5.0, 50.0);
// auto [t, y] = s.getTimeDomain();
// @endcode
// ==============================================================================

#pragma once

#include <prism/dsp/core/logging.h>
#include <prism/dsp/core/signal_config.h>
#include <prism/dsp/primitives/spectrum_buffer.h>
#include <prism/dsp/processors/band_clearer.h>
#include <prism/dsp/processors/domain_converter.h>
#include <prism/dsp/processors/frequency_component_writer.h>
#include <prism/dsp/processors/harmonic_synthesizer.h>
#include <prism/dsp/processors/spectrum_transforms.h>

#include <cstddef>
#include <utility>

namespace Prism {
namespace DSP {

class Signal {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Silent signal with the given layout
    /// @throws ConfigurationError on an unusable layout
    explicit Signal(const SignalConfig& config = SignalConfig{})
        : spectrum_(config) {
        logger()->debug("signal: {} bins ({} s at {} Hz)",
                        spectrum_.size(), config.duration, config.sampleRate);
    }

    /// @brief Silent signal of duration seconds at sampleRate Hz
    /// @throws ConfigurationError if either is non-positive or N is zero
    Signal(double duration, double sampleRate)
        : Signal(SignalConfig{duration, sampleRate}) {}

    /// @brief Signal initialised from a function of time (seconds)
    /// @throws ConfigurationError on an unusable layout
    template <typename TimeFunction>
    Signal(double duration, double sampleRate, TimeFunction&& func)
        : Signal(SignalConfig{duration, sampleRate}) {
        sampleTimeFunction(std::forward<TimeFunction>(func));
    }

    // =========================================================================
    // Mutators
    // =========================================================================

    /// @brief Add amplitude * cos(2*pi*freq*t + phase) to the signal
    /// @see writeFrequencyComponent()
    void setFrequency(double freq, double amplitude, double phaseDegrees = 0.0) {
        writeFrequencyComponent(spectrum_, freq, amplitude, phaseDegrees);
    }

    /// @brief Reset to silence
    void clear() noexcept {
        clearBand(spectrum_);
    }

    /// @brief Zero every bin whose frequency label satisfies predicate
    /// @see clearBand()
    template <typename Predicate>
    size_t clear(Predicate&& predicate) {
        return clearBand(spectrum_, std::forward<Predicate>(predicate));
    }

    /// @brief Replace the signal with a band-limited square wave
    /// @throws DomainError if freq <= 0 (signal untouched)
    /// @see synthesizeSquareWave()
    size_t squareWave(double freq, double fLimit = kDefaultHarmonicLimitHz) {
        return synthesizeSquareWave(spectrum_, freq, fLimit);
    }

    /// @brief Replace the signal with samples of func(t), t in seconds
    template <typename TimeFunction>
    void sampleTimeFunction(TimeFunction&& func) {
        DSP::sampleTimeFunction(spectrum_, std::forward<TimeFunction>(func));
    }

    /// @brief Move every positive-frequency component by deltaHz
    /// @see shiftFrequency()
    size_t shiftFrequency(double deltaHz) {
        return DSP::shiftFrequency(spectrum_, deltaHz);
    }

    /// @brief Add another signal into this one
    /// @throws ConfigurationError if the layouts differ
    void mix(const Signal& other) {
        mixSpectrum(spectrum_, other.spectrum_);
    }

    // =========================================================================
    // Views
    // =========================================================================

    [[nodiscard]] TimeDomainView getTimeDomain() const {
        return toTimeDomain(spectrum_);
    }

    [[nodiscard]] FrequencyDomainView getFrequencyDomain() const {
        return toFrequencyDomain(spectrum_);
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] const SpectrumBuffer& spectrum() const noexcept { return spectrum_; }
    [[nodiscard]] size_t numBins() const noexcept { return spectrum_.size(); }
    [[nodiscard]] double duration() const noexcept { return spectrum_.duration(); }
    [[nodiscard]] double sampleRate() const noexcept { return spectrum_.sampleRate(); }

private:
    SpectrumBuffer spectrum_;
};

} // namespace DSP
} // namespace Prism
