// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude and decibel computation using Google Highway for runtime
// SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These are the vectorized equivalents of the per-bin sqrt/log10 loops that
// dominate spectrogram generation: one call per frame instead of one libm
// call per bin.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Sono {
namespace DSP {

/// @brief Bulk compute magnitudes from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @note SIMD-accelerated with runtime ISA dispatch
void computeMagnitudeBulk(const float* complexData, std::size_t numBins,
                          float* mags) noexcept;

/// @brief Batch convert linear magnitudes to dB: 20 * log10(max(x, 1e-10))
/// @param input Linear magnitudes
/// @param output dB values (must hold count floats); may alias input
/// @param count Number of elements
/// @note NaN and non-positive inputs produce -200 dB; +inf is clamped to the
///       largest finite float before the log
/// @note SIMD-accelerated with runtime ISA dispatch
void batchMagnitudeToDb(const float* input, float* output, std::size_t count) noexcept;

/// @brief In-place scale of magnitudes by a constant gain
/// @param data Magnitudes (modified in-place)
/// @param count Number of elements
/// @param gain Multiplier (e.g. 1 / windowGain)
/// @note Non-finite results are replaced by 0
/// @note SIMD-accelerated with runtime ISA dispatch
void batchScaleMagnitudes(float* data, std::size_t count, float gain) noexcept;

} // namespace DSP
} // namespace Sono
