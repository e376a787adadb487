// ==============================================================================
// Layer 0: Core Tests - Decibel Conversion
// ==============================================================================
// Tests for: dsp/include/prism/dsp/core/db_utils.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <prism/dsp/core/db_utils.h>

#include <cmath>
#include <limits>

using namespace Prism::DSP;
using Catch::Approx;

// ==============================================================================
// gainToDb()
// ==============================================================================

TEST_CASE("gainToDb converts linear amplitude", "[db_utils][gain_to_db]") {
    REQUIRE(gainToDb(1.0) == Approx(0.0).margin(1e-12));
    REQUIRE(gainToDb(10.0) == Approx(20.0));
    REQUIRE(gainToDb(0.1) == Approx(-20.0));
    REQUIRE(gainToDb(0.5) == Approx(-6.0206).margin(1e-4));
}

TEST_CASE("gainToDb floors silence", "[db_utils][gain_to_db]") {
    REQUIRE(gainToDb(0.0) == kSilenceFloorDb);
    REQUIRE(gainToDb(-1.0) == kSilenceFloorDb);
    REQUIRE(gainToDb(std::numeric_limits<double>::quiet_NaN()) == kSilenceFloorDb);
    REQUIRE(gainToDb(1e-12) == kSilenceFloorDb);  // -240 dB
}

// ==============================================================================
// dbToGain()
// ==============================================================================

TEST_CASE("dbToGain converts decibels to amplitude", "[db_utils][db_to_gain]") {
    REQUIRE(dbToGain(0.0) == Approx(1.0));
    REQUIRE(dbToGain(20.0) == Approx(10.0));
    REQUIRE(dbToGain(-20.0) == Approx(0.1));
    REQUIRE(dbToGain(-6.0206) == Approx(0.5).margin(1e-5));
}

TEST_CASE("dbToGain inverts gainToDb above the floor", "[db_utils][db_to_gain]") {
    for (double gain : {1e-9, 0.001, 0.25, 1.0, 3.5, 1000.0}) {
        INFO("gain " << gain);
        REQUIRE(dbToGain(gainToDb(gain)) == Approx(gain).epsilon(1e-12));
    }
}
