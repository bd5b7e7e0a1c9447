// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude and decibel computation using Google Highway for runtime
// SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "sono/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Sono {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputeMagnitudeImpl: Complex[] -> mags[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputeMagnitudeImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                          float* HWY_RESTRICT mags) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        // Load interleaved [real0, imag0, real1, imag1, ...] into separate vectors
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        // Magnitude: sqrt(re^2 + im^2)
        const auto reSq = hn::Mul(re, re);
        hn::StoreU(hn::Sqrt(hn::MulAdd(im, im, reSq)), d, mags + k);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
    }
}

// -----------------------------------------------------------------------------
// MagnitudeToDbImpl: 20 * log10(max(x, 1e-10))
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MagnitudeToDbImpl(const float* input,
                       float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto minVal = hn::Set(d, 1e-10f);  // kMinMagnitude
    const auto maxVal = hn::Set(d, std::numeric_limits<float>::max());
    const auto twenty = hn::Set(d, 20.0f);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        auto v = hn::LoadU(d, input + k);
        v = hn::IfThenElse(hn::IsNaN(v), minVal, v);
        v = hn::Min(hn::Max(v, minVal), maxVal);  // Branchless clamp
        hn::StoreU(hn::Mul(twenty, hn::Log10(d, v)), d, output + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        float val = input[k];
        if (std::isnan(val)) val = 1e-10f;
        val = std::min(std::max(val, 1e-10f), std::numeric_limits<float>::max());
        output[k] = 20.0f * std::log10(val);
    }
}

// -----------------------------------------------------------------------------
// ScaleMagnitudesImpl: in-place gain with non-finite -> 0
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ScaleMagnitudesImpl(float* HWY_RESTRICT data, size_t count, float gain) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto g = hn::Set(d, gain);
    const auto zero = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::Mul(hn::LoadU(d, data + k), g);
        hn::StoreU(hn::IfThenElse(hn::IsFinite(v), v, zero), d, data + k);
    }
    for (; k < count; ++k) {
        const float v = data[k] * gain;
        data[k] = std::isfinite(v) ? v : 0.0f;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Sono

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "sono/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Sono {
namespace DSP {

HWY_EXPORT(ComputeMagnitudeImpl);
HWY_EXPORT(MagnitudeToDbImpl);
HWY_EXPORT(ScaleMagnitudesImpl);

void computeMagnitudeBulk(const float* complexData, std::size_t numBins,
                          float* mags) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputeMagnitudeImpl)(complexData, numBins, mags);
}

void batchMagnitudeToDb(const float* input, float* output, std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(MagnitudeToDbImpl)(input, output, count);
}

void batchScaleMagnitudes(float* data, std::size_t count, float gain) noexcept {
    HWY_DYNAMIC_DISPATCH(ScaleMagnitudesImpl)(data, count, gain);
}

}  // namespace DSP
}  // namespace Sono

#endif  // HWY_ONCE
