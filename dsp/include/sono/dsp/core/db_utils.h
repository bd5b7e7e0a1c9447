// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion Functions
// ==============================================================================
// Magnitude <-> decibel conversions used by the spectrogram and by the
// metering fallback path. Non-finite inputs are floored, never propagated.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>

namespace Sono {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Smallest magnitude fed into log10. 20*log10(1e-10) = -200 dB.
inline constexpr float kMinMagnitude = 1e-10f;

/// dB value produced for zero, negative, or NaN magnitudes.
inline constexpr float kMagnitudeFloorDb = -200.0f;

/// Metering floor. Values at or below this level are treated as silence.
inline constexpr float kMeteringFloorDb = -160.0f;

/// Metering ceiling (full scale).
inline constexpr float kMeteringCeilingDb = 0.0f;

namespace detail {

/// Constexpr-safe NaN check using IEEE 754 bit pattern.
///
/// Works even when a translation unit is built with -ffast-math, where
/// std::isnan() may be folded away by the compiler.
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    // NaN: exponent = 0xFF (all 1s), mantissa != 0
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Constexpr-safe infinity/NaN check (exponent all ones).
constexpr bool isNonFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) == 0x7F800000u;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear gain.
///
/// @formula   gain = 10^(dB/20)
/// @note      NaN input returns 0.0f
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert a linear FFT magnitude to decibels.
///
/// @formula   dB = 20 * log10(max(magnitude, 1e-10))
/// @return    Value >= kMagnitudeFloorDb. NaN and non-positive input map to the floor.
[[nodiscard]] inline float magnitudeToDb(float magnitude) noexcept {
    if (detail::isNaN(magnitude) || magnitude <= kMinMagnitude) {
        return kMagnitudeFloorDb;
    }
    if (detail::isNonFinite(magnitude)) {
        // +inf: clamp to the largest finite float's dB value
        magnitude = std::numeric_limits<float>::max();
    }
    return 20.0f * std::log10(magnitude);
}

/// Convert one metering reading (dBFS) to a linear amplitude.
///
/// Missing readings (NaN, -inf) are treated as kMeteringFloorDb. Readings are
/// clamped to [kMeteringFloorDb, kMeteringCeilingDb] and anything at the
/// floor is silence (0.0f).
[[nodiscard]] inline float meteringDbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    const float clamped = std::clamp(dB, kMeteringFloorDb, kMeteringCeilingDb);
    if (clamped <= kMeteringFloorDb) {
        return 0.0f;
    }
    return std::pow(10.0f, clamped / 20.0f);
}

} // namespace DSP
} // namespace Sono
