// ==============================================================================
// Layer 0: Core Utility - Decibel Conversion
// ==============================================================================

#pragma once

#include <cmath>

namespace Prism {
namespace DSP {

/// @brief Floor reported for silent (zero or negative) gains.
inline constexpr double kSilenceFloorDb = -200.0;

/// @brief Convert a linear amplitude to decibels (20 * log10(gain)).
/// @return kSilenceFloorDb for gains that are zero, negative or so small
///         that the result would fall below the floor
[[nodiscard]] inline double gainToDb(double gain) noexcept {
    if (!(gain > 0.0)) {
        return kSilenceFloorDb;
    }
    const double db = 20.0 * std::log10(gain);
    return db < kSilenceFloorDb ? kSilenceFloorDb : db;
}

/// @brief Convert decibels to a linear amplitude (10^(dB/20)).
[[nodiscard]] inline double dbToGain(double db) noexcept {
    return std::pow(10.0, db / 20.0);
}

} // namespace DSP
} // namespace Prism
