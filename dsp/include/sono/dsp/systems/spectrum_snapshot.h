// ==============================================================================
// Layer 3: System Component - Spectrum Snapshots
// ==============================================================================
// Single-FFT spectra used for the auxiliary plots next to a spectrogram:
//
// - Time slice: the spectrum of the samples under one spectrogram frame,
//   sized to the next power of two that holds the segment.
// - Time slice from spectrogram: fallback when no PCM is available; a crude
//   pseudo-signal built from the lowest bin of neighbouring frames.
// - Full recording: one FFT over the whole (possibly decimated) recording,
//   reduced to at most 200 plot points.
//
// All snapshot magnitudes are linear and multiplied by 1/windowGain so that
// spectra taken with different windows are comparable.
//
// Dependencies:
//   - Layer 0: analysis_error.h, window_functions.h
//   - Layer 2: spectrum_analyzer.h
//   - Layer 3: spectrogram_generator.h (options and result types)
// ==============================================================================

#pragma once

#include <sono/dsp/core/analysis_error.h>
#include <sono/dsp/core/window_functions.h>
#include <sono/dsp/systems/spectrogram_generator.h>

#include <cstddef>
#include <vector>

namespace Sono {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Longest input analyzed by a single full-recording FFT (2^20 samples)
inline constexpr size_t kMaxFullSpectrumSamples = size_t{1} << 20;

/// Upper bound on plot points produced by the full-recording reduction
inline constexpr size_t kMaxSpectrumPlotPoints = 200;

/// Minimum neighbourhood (in frames) used by the spectrogram fallback
inline constexpr size_t kMinFallbackFrames = 10;

// =============================================================================
// Types
// =============================================================================

/// @brief One point of a reduced spectrum plot
struct SpectrumPlotPoint {
    float frequency = 0.0f;  ///< Hz
    float magnitude = 0.0f;  ///< Linear, window-gain corrected
};

/// @brief A spectral peak
struct SpectralPeak {
    size_t bin = 0;
    float frequency = 0.0f;
    float magnitude = 0.0f;
};

/// @brief Result of a single-FFT spectrum analysis
struct SpectrumSnapshot {
    std::vector<float> spectrum;      ///< Linear magnitudes, fftSize/2 bins
    std::vector<float> frequencies;   ///< Hz, k * effectiveSampleRate / fftSize
    double maxFreq = 0.0;             ///< (fftSize/2) * effectiveSampleRate / fftSize
    size_t fftSize = 0;
    double effectiveSampleRate = 0.0;
    WindowType windowType = WindowType::Hanning;

    size_t decimationFactor = 1;      ///< Full recording: input block size

    /// Full recording only: bins within [minFreq, maxFreq], reduced for plotting
    std::vector<SpectrumPlotPoint> plotPoints;
};

// =============================================================================
// Analysis
// =============================================================================

/// @brief Spectrum of the PCM segment under one spectrogram frame
/// @param samples PCM the spectrogram was generated from
/// @param numSamples Length of samples
/// @param result Spectrogram (for frame count, window type and sample rate)
/// @param frameIndex Frame to analyze, < result.numFrames()
/// @param snapshot Output
[[nodiscard]] AnalysisError analyzeTimeSlice(const float* samples, size_t numSamples,
                                             const SpectrogramResult& result,
                                             size_t frameIndex,
                                             SpectrumSnapshot& snapshot);

/// @brief Time-slice spectrum without PCM, approximated from the spectrogram
///
/// Takes max(10, floor(frames * 0.05)) frames centered on frameIndex (clamped
/// to the matrix), converts the lowest bin of each from dB to linear
/// (-160 dB and below become 0) and analyzes that sequence.
[[nodiscard]] AnalysisError analyzeTimeSliceFromSpectrogram(const SpectrogramResult& result,
                                                            size_t frameIndex,
                                                            SpectrumSnapshot& snapshot);

/// @brief Spectrum of a whole recording with a reduced plot series
/// @param options samplingRate, windowType, minFreq and maxFreq are used;
///        maxFreq 0 means half the effective sample rate
[[nodiscard]] AnalysisError analyzeFullRecording(const float* samples, size_t numSamples,
                                                 const SpectrogramOptions& options,
                                                 SpectrumSnapshot& snapshot);

// =============================================================================
// Helpers
// =============================================================================

/// @brief Peak-preserving decimation to at most maxSamples samples
///
/// With factor = ceil(n / maxSamples), output sample i is the largest |x| in
/// [floor(i*factor), min(n, floor((i+1)*factor))) carrying the sign of the
/// block's first sample. Inputs that already fit are copied unchanged.
///
/// @return The decimation factor (1 when no decimation was needed)
size_t decimateMaxAbs(const float* samples, size_t numSamples, size_t maxSamples,
                      std::vector<float>& output);

/// @brief Keep bins within [minFreq, maxFreq]; if more than maxPoints remain,
///        keep the loudest bin of each block of ceil(count / maxPoints)
[[nodiscard]] std::vector<SpectrumPlotPoint> reduceForPlot(const std::vector<float>& spectrum,
                                                           const std::vector<float>& frequencies,
                                                           double minFreq, double maxFreq,
                                                           size_t maxPoints = kMaxSpectrumPlotPoints);

/// @brief The `count` loudest bins, loudest first (ties keep bin order)
[[nodiscard]] std::vector<SpectralPeak> findTopPeaks(const SpectrumSnapshot& snapshot,
                                                     size_t count = 3);

} // namespace DSP
} // namespace Sono
