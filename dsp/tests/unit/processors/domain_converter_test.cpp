// ==============================================================================
// Layer 2: Processor Tests - Domain Converter
// ==============================================================================
// Tests for: dsp/include/prism/dsp/processors/domain_converter.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <prism/dsp/processors/domain_converter.h>
#include <prism/dsp/processors/frequency_component_writer.h>
#include <prism/dsp/core/db_utils.h>
#include <prism/dsp/core/math_constants.h>

#include <cmath>

using namespace Prism::DSP;
using Catch::Approx;

namespace {
constexpr double kTolerance = 1e-9;
} // namespace

// ==============================================================================
// toTimeDomain()
// ==============================================================================

TEST_CASE("toTimeDomain time axis spans [0, duration] inclusively", "[domain_converter][time]") {
    SpectrumBuffer spectrum(0.5, 10.0);  // N = 5

    const auto view = toTimeDomain(spectrum);
    REQUIRE(view.time.size() == 5);
    REQUIRE(view.samples.size() == 5);
    REQUIRE(view.time[0] == 0.0);
    REQUIRE(view.time[1] == Approx(0.125));
    REQUIRE(view.time[4] == Approx(0.5));
}

TEST_CASE("toTimeDomain of a single-bin spectrum", "[domain_converter][time]") {
    SpectrumBuffer spectrum(1.0, 1.0);  // N = 1
    spectrum[0] = {3.0, 0.0};

    const auto view = toTimeDomain(spectrum);
    REQUIRE(view.size() == 1);
    REQUIRE(view.time[0] == 0.0);
    REQUIRE(view.samples[0] == Approx(3.0));
}

TEST_CASE("toTimeDomain of silence is all zeros", "[domain_converter][time]") {
    SpectrumBuffer spectrum(1.0, 97.0);  // prime length

    const auto view = toTimeDomain(spectrum);
    REQUIRE(view.size() == 97);
    for (double sample : view.samples) {
        REQUIRE(sample == Approx(0.0).margin(kTolerance));
    }
}

TEST_CASE("toTimeDomain sums components", "[domain_converter][time]") {
    SpectrumBuffer spectrum(1.0, 97.0);
    writeFrequencyComponent(spectrum, 0.0, 0.25);
    writeFrequencyComponent(spectrum, 7.0, 1.0, 45.0);
    writeFrequencyComponent(spectrum, 20.0, 0.5);

    const auto view = toTimeDomain(spectrum);
    for (size_t n = 0; n < 97; ++n) {
        const double t = static_cast<double>(n) / 97.0;
        const double expected = 0.25
                              + std::cos(kTwoPi * 7.0 * t + kPi / 4.0)
                              + 0.5 * std::cos(kTwoPi * 20.0 * t);
        INFO("sample " << n);
        REQUIRE(view.samples[n] == Approx(expected).margin(kTolerance));
    }
}

TEST_CASE("toTimeDomain does not modify the spectrum", "[domain_converter][time]") {
    SpectrumBuffer spectrum(1.0, 16.0);
    writeFrequencyComponent(spectrum, 3.0, 1.0, 10.0);
    const SpectrumBuffer before = spectrum;

    (void)toTimeDomain(spectrum);
    (void)toFrequencyDomain(spectrum);

    for (size_t i = 0; i < spectrum.size(); ++i) {
        REQUIRE(spectrum[i] == before[i]);
    }
}

// ==============================================================================
// toFrequencyDomain()
// ==============================================================================

TEST_CASE("toFrequencyDomain covers DC to Nyquist", "[domain_converter][frequency]") {
    SECTION("even N ends at Nyquist") {
        SpectrumBuffer spectrum(1.0, 8.0);
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.size() == 5);
        REQUIRE(view.frequencies.front() == 0.0);
        REQUIRE(view.frequencies.back() == Approx(4.0));
    }

    SECTION("odd N stops below Nyquist") {
        SpectrumBuffer spectrum(1.0, 7.0);
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.size() == 4);
        REQUIRE(view.frequencies.back() == Approx(3.0));
    }

    SECTION("sub-Hz resolution") {
        SpectrumBuffer spectrum(4.0, 10.0);  // 0.25 Hz per bin
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.size() == 21);
        REQUIRE(view.frequencies[1] == Approx(0.25));
        REQUIRE(view.frequencies[20] == Approx(5.0));
    }
}

TEST_CASE("toFrequencyDomain reports written amplitudes and phases", "[domain_converter][frequency]") {
    SpectrumBuffer spectrum(1.0, 100.0);
    writeFrequencyComponent(spectrum, 0.0, 0.4);
    writeFrequencyComponent(spectrum, 10.0, 1.5, 30.0);
    writeFrequencyComponent(spectrum, 25.0, 0.2, -120.0);

    const auto view = toFrequencyDomain(spectrum);
    REQUIRE(view.size() == 51);

    REQUIRE(view.magnitudes[0] == Approx(0.4).margin(kTolerance));
    REQUIRE(view.magnitudes[10] == Approx(1.5).margin(kTolerance));
    REQUIRE(view.phasesDegrees[10] == Approx(30.0).margin(1e-6));
    REQUIRE(view.magnitudes[25] == Approx(0.2).margin(kTolerance));
    REQUIRE(view.phasesDegrees[25] == Approx(-120.0).margin(1e-6));
    REQUIRE(view.magnitudes[11] == Approx(0.0).margin(kTolerance));
}

TEST_CASE("toFrequencyDomain reports the written amplitude at Nyquist", "[domain_converter][frequency][nyquist]") {
    SpectrumBuffer spectrum(1.0, 8.0);  // N = 8, Nyquist bin 4

    SECTION("zero phase") {
        writeFrequencyComponent(spectrum, 4.0, 1.0);
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.frequencies[4] == Approx(4.0));
        REQUIRE(view.magnitudes[4] == Approx(1.0).margin(kTolerance));
        REQUIRE(view.phasesDegrees[4] == Approx(0.0).margin(1e-9));
    }

    SECTION("Nyquist and a regular bin agree") {
        writeFrequencyComponent(spectrum, 2.0, 0.5);
        writeFrequencyComponent(spectrum, 4.0, 0.5);
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.magnitudes[2] == Approx(0.5).margin(kTolerance));
        REQUIRE(view.magnitudes[4] == Approx(0.5).margin(kTolerance));
    }

    SECTION("phase keeps only the cosine projection") {
        writeFrequencyComponent(spectrum, 4.0, 1.0, 60.0);
        const auto view = toFrequencyDomain(spectrum);

        // Matches the 0.5 * (-1)^n the time view reproduces
        REQUIRE(view.magnitudes[4] == Approx(0.5).margin(kTolerance));
    }

    SECTION("sampled alternation has unit amplitude") {
        sampleTimeFunction(spectrum, [](double t) {
            return std::cos(kTwoPi * 4.0 * t);
        });
        const auto view = toFrequencyDomain(spectrum);

        REQUIRE(view.magnitudes[4] == Approx(1.0).margin(kTolerance));
        REQUIRE(view.magnitudes[2] == Approx(0.0).margin(kTolerance));
    }
}

TEST_CASE("toFrequencyDomain doubles the last bin of odd N", "[domain_converter][frequency]") {
    SpectrumBuffer spectrum(1.0, 7.0);  // N = 7, no Nyquist bin
    writeFrequencyComponent(spectrum, 3.0, 0.8);

    const auto view = toFrequencyDomain(spectrum);
    REQUIRE(view.size() == 4);
    REQUIRE(view.magnitudes[3] == Approx(0.8).margin(kTolerance));
}

TEST_CASE("toFrequencyDomain folds -180 degrees to +180", "[domain_converter][frequency]") {
    SpectrumBuffer spectrum(1.0, 100.0);
    spectrum[5] = {-1.0, 0.0};
    spectrum[95] = {-1.0, 0.0};

    const auto view = toFrequencyDomain(spectrum);
    REQUIRE(view.phasesDegrees[5] == Approx(180.0));

    STATIC_REQUIRE(detail::foldPhaseDegrees(-180.0) == 180.0);
    STATIC_REQUIRE(detail::foldPhaseDegrees(-179.0) == -179.0);
    STATIC_REQUIRE(detail::foldPhaseDegrees(180.0) == 180.0);
}

TEST_CASE("toFrequencyDomain magnitudes in decibels", "[domain_converter][frequency]") {
    SpectrumBuffer spectrum(1.0, 100.0);
    writeFrequencyComponent(spectrum, 10.0, 1.0);
    writeFrequencyComponent(spectrum, 20.0, 0.1);

    const auto db = toFrequencyDomain(spectrum).magnitudesDb();
    REQUIRE(db.size() == 51);
    REQUIRE(db[10] == Approx(0.0).margin(1e-9));
    REQUIRE(db[20] == Approx(-20.0).margin(1e-9));
    REQUIRE(db[30] == kSilenceFloorDb);
}

// ==============================================================================
// sampleTimeFunction()
// ==============================================================================

TEST_CASE("sampleTimeFunction recovers the components of a sampled signal", "[domain_converter][sample]") {
    SpectrumBuffer spectrum(1.0, 100.0);

    sampleTimeFunction(spectrum, [](double t) {
        return 0.2 * std::sin(kTwoPi * 3.0 * t) + 0.3 * std::sin(kTwoPi * 2.0 * t);
    });

    const auto view = toFrequencyDomain(spectrum);
    REQUIRE(view.magnitudes[2] == Approx(0.3).margin(kTolerance));
    REQUIRE(view.magnitudes[3] == Approx(0.2).margin(kTolerance));
    REQUIRE(view.phasesDegrees[2] == Approx(-90.0).margin(1e-6));
    REQUIRE(view.phasesDegrees[3] == Approx(-90.0).margin(1e-6));
    REQUIRE(view.magnitudes[4] == Approx(0.0).margin(kTolerance));
    REQUIRE(spectrum.isConjugateSymmetric(kTolerance));
}

TEST_CASE("sampleTimeFunction round-trips through toTimeDomain", "[domain_converter][sample]") {
    SpectrumBuffer spectrum(0.5, 101.0);  // N = 50

    auto func = [](double t) { return std::exp(-3.0 * t) - 0.5; };
    sampleTimeFunction(spectrum, func);

    const auto view = toTimeDomain(spectrum);
    for (size_t n = 0; n < view.size(); ++n) {
        REQUIRE(view.samples[n] == Approx(func(static_cast<double>(n) / 101.0)).margin(kTolerance));
    }
}

TEST_CASE("sampleTimeFunction replaces previous content", "[domain_converter][sample]") {
    SpectrumBuffer spectrum(1.0, 64.0);
    writeFrequencyComponent(spectrum, 5.0, 1.0);

    sampleTimeFunction(spectrum, [](double) { return 0.0; });

    const auto view = toFrequencyDomain(spectrum);
    for (double magnitude : view.magnitudes) {
        REQUIRE(magnitude == Approx(0.0).margin(kTolerance));
    }
}
