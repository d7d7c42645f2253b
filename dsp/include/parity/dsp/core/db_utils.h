// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion Functions and Sentinel Levels
// ==============================================================================
// Every guard epsilon used by the analysis pipeline lives here, one per
// numerical purpose:
//
//   kNormalizeEpsilon  1e-12  peak normalization divisor
//   kLevelEpsilon      1e-20  RMS / crest / envelope logarithms
//   kPowerFloor        1e-30  power spectral density floor
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

namespace Parity {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Added to the peak before dividing during normalization.
inline constexpr double kNormalizeEpsilon = 1e-12;

/// Guards both the inner mean and the outer logarithm of amplitude levels.
inline constexpr double kLevelEpsilon = 1e-20;

/// Lower clamp of linear power before conversion to dB (-300 dB).
inline constexpr double kPowerFloor = 1e-30;

/// Level reported when a band contains no spectral bin, and the flat level
/// of a spectrum estimated from a degenerate (too short) buffer.
inline constexpr float kNoDataDb = -120.0f;

/// Level of a power spectrum bin clamped at kPowerFloor.
inline constexpr float kPowerFloorDb = -300.0f;

// ==============================================================================
// Functions
// ==============================================================================

/// Convert a linear amplitude (RMS or peak) to decibels.
///
/// @param amplitude  Linear amplitude (>= 0)
/// @return           20 * log10(amplitude + kLevelEpsilon)
///
/// @example          amplitudeToDb(1.0)   -> 0.0
/// @example          amplitudeToDb(0.1)   -> -20.0
/// @example          amplitudeToDb(0.0)   -> -400.0
[[nodiscard]] inline double amplitudeToDb(double amplitude) noexcept {
    return 20.0 * std::log10(amplitude + kLevelEpsilon);
}

/// Convert linear power to decibels, clamped at kPowerFloor.
///
/// @param power  Linear power (any value; negatives and zero hit the floor)
/// @return       10 * log10(max(power, kPowerFloor))
[[nodiscard]] inline double powerToDb(double power) noexcept {
    return 10.0 * std::log10(std::max(power, kPowerFloor));
}

/// Convert decibels back to linear power.
///
/// @formula power = 10^(dB/10)
[[nodiscard]] inline double dbToPower(double dB) noexcept {
    return std::pow(10.0, dB / 10.0);
}

/// Convert decibels to a linear amplitude gain.
///
/// @formula gain = 10^(dB/20)
[[nodiscard]] inline double dbToGain(double dB) noexcept {
    return std::pow(10.0, dB / 20.0);
}

} // namespace DSP
} // namespace Parity
