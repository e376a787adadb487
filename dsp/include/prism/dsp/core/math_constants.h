// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for spectral calculations.
// All components should import these constants instead of defining locally.
//
// Spectrum math is carried in double precision throughout, so the constants
// are double as well.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Prism {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant: 3.14159265358979323846
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

// =============================================================================
// Angle Conversion
// =============================================================================

/// Multiply degrees by this to get radians
inline constexpr double kDegreesToRadians = kPi / 180.0;

/// Multiply radians by this to get degrees
inline constexpr double kRadiansToDegrees = 180.0 / kPi;

} // namespace DSP
} // namespace Prism
