// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Window function generators applied to every analysis frame before the FFT.
// Includes Hanning, Hamming, Blackman, Bartlett and Rectangular windows plus
// the amplitude gain each one introduces.
//
// All shapes use the symmetric variant (phase divides by N-1), so the first
// and last samples of a Hanning table are both exactly zero.
// ==============================================================================

#pragma once

#include <sono/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace Sono {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported window function types for spectral analysis
enum class WindowType : uint8_t {
    Hanning,     ///< 0.5 * (1 - cos(x))
    Hamming,     ///< 0.54 - 0.46 * cos(x)
    Blackman,    ///< 0.42 - 0.5 * cos(x) + 0.08 * cos(2x)
    Bartlett,    ///< Triangular, zero at both ends
    Rectangular  ///< All ones (no tapering)
};

/// Number of window types (for iteration in tests and CLI help)
inline constexpr size_t kNumWindowTypes = 5;

// =============================================================================
// Window Gain
// =============================================================================

/// @brief Coherent gain of a window (its mean value for large N).
///
/// Multiplying a windowed FFT magnitude by 1/gain undoes the attenuation the
/// window introduced, so spectra taken with different windows line up.
[[nodiscard]] constexpr float windowGain(WindowType type) noexcept {
    switch (type) {
        case WindowType::Hanning:     return 0.5f;
        case WindowType::Hamming:     return 0.54f;
        case WindowType::Blackman:    return 0.42f;
        case WindowType::Bartlett:    return 0.5f;
        case WindowType::Rectangular: return 1.0f;
    }
    return 1.0f;
}

/// @brief Configuration name of a window type ("hanning", "hamming", ...)
[[nodiscard]] constexpr std::string_view windowTypeName(WindowType type) noexcept {
    switch (type) {
        case WindowType::Hanning:     return "hanning";
        case WindowType::Hamming:     return "hamming";
        case WindowType::Blackman:    return "blackman";
        case WindowType::Bartlett:    return "bartlett";
        case WindowType::Rectangular: return "rectangular";
    }
    return "rectangular";
}

/// @brief Parse a configuration name. Unknown names fall back to Rectangular.
[[nodiscard]] constexpr WindowType parseWindowType(std::string_view name) noexcept {
    if (name == "hanning" || name == "hann") return WindowType::Hanning;
    if (name == "hamming") return WindowType::Hamming;
    if (name == "blackman") return WindowType::Blackman;
    if (name == "bartlett") return WindowType::Bartlett;
    return WindowType::Rectangular;
}

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

namespace detail {

/// Phase 2*pi*n/(N-1), evaluated on the mirrored index for the second half.
/// cos(2*pi - x) == cos(x), so this keeps tables exactly symmetric and makes
/// the last sample bit-identical to the first.
[[nodiscard]] inline double phaseAt(size_t n, size_t size) noexcept {
    const size_t last = size - 1;
    const size_t mirrored = (2 * n > last) ? last - n : n;
    return kTwoPiD * static_cast<double>(mirrored) / static_cast<double>(last);
}

} // namespace detail

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------
// A size of 1 has no defined phase (N-1 == 0); every generator writes 1.0.

/// @brief Fill buffer with Hanning window
/// @note Formula: 0.5 * (1 - cos(2*pi*n/(N-1)))
inline void generateHanning(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) { output[0] = 1.0f; return; }

    for (size_t n = 0; n < size; ++n) {
        output[n] = static_cast<float>(0.5 * (1.0 - std::cos(detail::phaseAt(n, size))));
    }
}

/// @brief Fill buffer with Hamming window
/// @note Formula: 0.54 - 0.46*cos(2*pi*n/(N-1))
inline void generateHamming(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) { output[0] = 1.0f; return; }

    for (size_t n = 0; n < size; ++n) {
        output[n] = static_cast<float>(0.54 - 0.46 * std::cos(detail::phaseAt(n, size)));
    }
}

/// @brief Fill buffer with Blackman window
/// @note Formula: 0.42 - 0.5*cos(x) + 0.08*cos(2x), x = 2*pi*n/(N-1)
inline void generateBlackman(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) { output[0] = 1.0f; return; }

    for (size_t n = 0; n < size; ++n) {
        const double x = detail::phaseAt(n, size);
        const double value = 0.42 - 0.5 * std::cos(x) + 0.08 * std::cos(2.0 * x);
        // Endpoints evaluate to ~-1e-17; keep the table non-negative
        output[n] = value > 0.0 ? static_cast<float>(value) : 0.0f;
    }
}

/// @brief Fill buffer with Bartlett (triangular) window
/// @note Formula: (2/(N-1)) * ((N-1)/2 - |n - (N-1)/2|)
inline void generateBartlett(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) { output[0] = 1.0f; return; }

    const double M = static_cast<double>(size - 1);
    const double half = M * 0.5;
    for (size_t n = 0; n < size; ++n) {
        output[n] = static_cast<float>((2.0 / M) * (half - std::abs(static_cast<double>(n) - half)));
    }
}

/// @brief Fill buffer with ones
inline void generateRectangular(float* output, size_t size) noexcept {
    if (output == nullptr) return;
    for (size_t n = 0; n < size; ++n) {
        output[n] = 1.0f;
    }
}

/// @brief Fill buffer with the window of the given type
inline void fill(WindowType type, float* output, size_t size) noexcept {
    switch (type) {
        case WindowType::Hanning:
            generateHanning(output, size);
            break;
        case WindowType::Hamming:
            generateHamming(output, size);
            break;
        case WindowType::Blackman:
            generateBlackman(output, size);
            break;
        case WindowType::Bartlett:
            generateBartlett(output, size);
            break;
        case WindowType::Rectangular:
            generateRectangular(output, size);
            break;
    }
}

// -----------------------------------------------------------------------------
// Factory Function
// -----------------------------------------------------------------------------

/// @brief Generate window coefficients (allocates vector)
/// @param type Window type
/// @param size Window size
/// @return Vector of window coefficients
/// @note NOT real-time safe (allocates memory)
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);
    fill(type, window.data(), size);
    return window;
}

} // namespace Window

} // namespace DSP
} // namespace Sono
