// ==============================================================================
// Layer 0: Core Utility - Spectrogram Color Maps
// ==============================================================================
// Maps a dB magnitude onto an 8-bit RGB color for spectrogram display.
//
// The dB value is first normalized against the dynamic range:
//   norm = clamp((dB + range) / range, 0, 1)
// then log-scaled so quiet detail gets more of the palette:
//   adjusted = clamp(log1p(9*norm + 1e-6) / log1p(10), 0, 1)
//
// Viridis, Plasma and Inferno use `adjusted`; Magma and Grayscale use `norm`.
// The palettes are linear/polynomial approximations, not lookup tables.
// ==============================================================================

#pragma once

#include <sono/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace Sono {
namespace DSP {

/// @brief Available display palettes
enum class ColorMap : uint8_t {
    Viridis,
    Magma,
    Plasma,
    Inferno,
    Grayscale
};

inline constexpr size_t kNumColorMaps = 5;

/// @brief 8-bit RGB triple
struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    [[nodiscard]] constexpr bool operator==(const Rgb8&) const noexcept = default;
};

[[nodiscard]] constexpr std::string_view colorMapName(ColorMap map) noexcept {
    switch (map) {
        case ColorMap::Viridis:   return "viridis";
        case ColorMap::Magma:     return "magma";
        case ColorMap::Plasma:    return "plasma";
        case ColorMap::Inferno:   return "inferno";
        case ColorMap::Grayscale: return "grayscale";
    }
    return "viridis";
}

/// @brief Parse a palette name. Unknown names fall back to Viridis.
[[nodiscard]] constexpr ColorMap parseColorMap(std::string_view name) noexcept {
    if (name == "magma") return ColorMap::Magma;
    if (name == "plasma") return ColorMap::Plasma;
    if (name == "inferno") return ColorMap::Inferno;
    if (name == "grayscale") return ColorMap::Grayscale;
    return ColorMap::Viridis;
}

namespace detail {

/// floor(255 * clamp(v, 0, 1)); NaN maps to 0
[[nodiscard]] inline uint8_t toChannel(double v) noexcept {
    if (!(v > 0.0)) return 0;
    if (v >= 1.0) return 255;
    return static_cast<uint8_t>(std::floor(255.0 * v));
}

/// sqrt of a polynomial that dips slightly below zero near x = 1
[[nodiscard]] inline double safeSqrt(double v) noexcept {
    return v > 0.0 ? std::sqrt(v) : 0.0;
}

} // namespace detail

/// @brief Normalized position of a dB value inside the dynamic range
/// @note Non-finite input is treated as the metering floor (-160 dB)
[[nodiscard]] inline double normalizeDb(float db, float dynamicRange) noexcept {
    const double value = std::isfinite(db) ? static_cast<double>(db)
                                           : static_cast<double>(kMeteringFloorDb);
    if (!(dynamicRange > 0.0f)) {
        return value >= 0.0 ? 1.0 : 0.0;
    }
    const double range = static_cast<double>(dynamicRange);
    return std::clamp((value + range) / range, 0.0, 1.0);
}

/// @brief Map a dB magnitude to a palette color
/// @param db Magnitude in dB (0 dB = full scale)
/// @param dynamicRange Span in dB mapped onto the palette (values below -range
///        get the palette's lowest color)
/// @param map Palette
[[nodiscard]] inline Rgb8 mapMagnitudeToColor(float db, float dynamicRange,
                                              ColorMap map = ColorMap::Viridis) noexcept {
    const double norm = normalizeDb(db, dynamicRange);
    const double adjusted =
        std::clamp(std::log1p(norm * 9.0 + 1e-6) / std::log1p(10.0), 0.0, 1.0);

    switch (map) {
        case ColorMap::Viridis:
            return {detail::toChannel(0.267004 + adjusted * 0.731859),
                    detail::toChannel(0.004874 + adjusted * 0.829359),
                    detail::toChannel(0.329415 + adjusted * -0.144721)};

        case ColorMap::Magma:
            return {detail::toChannel(0.001462 + norm * 0.998538),
                    detail::toChannel(0.000466 + norm * 0.533354),
                    detail::toChannel(0.013866 + norm * 0.786254)};

        case ColorMap::Plasma:
            return {detail::toChannel(0.050383 + adjusted * 0.949617),
                    detail::toChannel(0.029803 + adjusted * 0.970197),
                    detail::toChannel(0.527975 + adjusted * -0.527975)};

        case ColorMap::Inferno: {
            const double x = adjusted;
            return {detail::toChannel(detail::safeSqrt(x * (0.9896 - x * (2.348 - x * 1.358)))),
                    detail::toChannel(detail::safeSqrt(x * (0.3267 - x * (0.1169 + x * 0.4194)))),
                    detail::toChannel(detail::safeSqrt(
                        x * (0.01587 + x * (0.7095 - x * (1.225 - x * 0.498)))))};
        }

        case ColorMap::Grayscale: {
            const uint8_t v = detail::toChannel(norm);
            return {v, v, v};
        }
    }
    return {};
}

} // namespace DSP
} // namespace Sono
