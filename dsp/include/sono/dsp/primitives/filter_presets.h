// ==============================================================================
// Layer 1: DSP Primitive - Built-in IIR Filter Presets
// ==============================================================================
// Static coefficient sets for the pre-analysis filter stage. Coefficients are
// designed for 44.1 kHz; at other rates the corner frequencies scale with
// the sample rate.
// ==============================================================================

#pragma once

#include <sono/dsp/primitives/iir_filter.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Sono {
namespace DSP {

enum class FilterPreset : uint8_t {
    Identity,          ///< y[n] = x[n]
    DCBlocker,         ///< y[n] = x[n] - x[n-1] + R*y[n-1], 10 Hz corner
    HighPass100Hz      ///< 2nd-order Butterworth high-pass, 100 Hz corner
};

inline constexpr size_t kNumFilterPresets = 3;

namespace detail {

// R = exp(-2*pi*10/44100)
inline constexpr double kDCBlockerPole = 0.9985762559135825;

// RBJ cookbook high-pass, Q = 1/sqrt(2), fc = 100 Hz, fs = 44100 Hz
inline constexpr std::array<double, 3> kHighPass100B = {
    0.9899760126801738, -1.9799520253603475, 0.9899760126801738};
inline constexpr std::array<double, 3> kHighPass100A = {
    1.0, -1.9798515425143588, 0.9800525082063363};

} // namespace detail

/// @brief Coefficients for a built-in preset
[[nodiscard]] inline IIRCoefficients filterPreset(FilterPreset preset) {
    switch (preset) {
        case FilterPreset::Identity:
            return {{1.0}, {1.0}};
        case FilterPreset::DCBlocker:
            return {{1.0, -1.0}, {1.0, -detail::kDCBlockerPole}};
        case FilterPreset::HighPass100Hz:
            return {{detail::kHighPass100B.begin(), detail::kHighPass100B.end()},
                    {detail::kHighPass100A.begin(), detail::kHighPass100A.end()}};
    }
    return {{1.0}, {1.0}};
}

[[nodiscard]] constexpr std::string_view filterPresetName(FilterPreset preset) noexcept {
    switch (preset) {
        case FilterPreset::Identity:      return "identity";
        case FilterPreset::DCBlocker:     return "dc-blocker";
        case FilterPreset::HighPass100Hz: return "highpass-100";
    }
    return "identity";
}

/// @brief Look up a preset by configuration name
[[nodiscard]] constexpr std::optional<FilterPreset> parseFilterPreset(std::string_view name) noexcept {
    if (name == "identity") return FilterPreset::Identity;
    if (name == "dc-blocker") return FilterPreset::DCBlocker;
    if (name == "highpass-100") return FilterPreset::HighPass100Hz;
    return std::nullopt;
}

} // namespace DSP
} // namespace Sono
