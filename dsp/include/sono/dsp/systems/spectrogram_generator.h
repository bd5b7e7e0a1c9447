// ==============================================================================
// Layer 3: System Component - Spectrogram Generator
// ==============================================================================
// Short-time Fourier transform over a whole recording, producing a dense
// frames x bins matrix of dB magnitudes together with its time and frequency
// axes.
//
// Input is either normalized PCM or a sequence of dB metering readings (the
// fallback when no samples were captured). Metering readings are converted
// to linear amplitude and then analyzed as if they were samples.
//
// Framing:
//   hop         = floor(fftSize * (1 - overlap))
//   totalFrames = max(1, floor((N - fftSize) / hop) + 1)
//   time[i]     = i / (totalFrames - 1) * N / sampleRate
//                 (N / sampleRate / 2 for a single frame)
// Inputs shorter than fftSize are zero-padded to fftSize first.
//
// Dependencies:
//   - Layer 0: analysis_error.h, color_map.h, db_utils.h, spectral_simd.h,
//              window_functions.h
//   - Layer 2: spectrum_analyzer.h
// ==============================================================================

#pragma once

#include <sono/dsp/core/analysis_error.h>
#include <sono/dsp/core/color_map.h>
#include <sono/dsp/core/window_functions.h>
#include <sono/dsp/processors/spectrum_analyzer.h>

#include <cstddef>
#include <string>
#include <vector>

namespace Sono {
namespace DSP {

// =============================================================================
// Options
// =============================================================================

/// @brief Spectrogram configuration
///
/// minFreq, maxFreq, dynamicRange and colorMap only affect display; they are
/// carried through so a result fully describes how it should be rendered.
struct SpectrogramOptions {
    double samplingRate = 44100.0;
    size_t fftSize = 1024;
    double overlap = 0.75;
    WindowType windowType = WindowType::Hanning;
    double minFreq = 0.0;
    double maxFreq = 0.0;          ///< 0 means samplingRate / 2
    float dynamicRange = 50.0f;    ///< dB
    ColorMap colorMap = ColorMap::Viridis;
    double duration = 0.0;         ///< Filled in by the generator

    /// @brief Copy with display defaults applied (maxFreq 0 -> Nyquist)
    [[nodiscard]] SpectrogramOptions resolved() const noexcept {
        SpectrogramOptions out = *this;
        if (!(out.maxFreq > 0.0)) {
            out.maxFreq = samplingRate / 2.0;
        }
        return out;
    }

    /// @brief Frame advance in samples (0 when overlap is out of range)
    [[nodiscard]] size_t hopSize() const noexcept;
};

/// @brief Check options before any computation
[[nodiscard]] AnalysisError validateOptions(const SpectrogramOptions& options) noexcept;

// =============================================================================
// Result
// =============================================================================

/// @brief Spectrogram matrix plus axes
///
/// Magnitudes are stored row-major, one row of numBins() values per frame.
struct SpectrogramResult {
    std::vector<float> magnitudesDb;
    std::vector<float> frequencies;  ///< Hz, length fftSize/2, strictly increasing
    std::vector<double> times;       ///< Seconds, one per frame, non-decreasing
    SpectrogramOptions options;      ///< Effective options with duration set

    [[nodiscard]] size_t numFrames() const noexcept { return times.size(); }
    [[nodiscard]] size_t numBins() const noexcept { return frequencies.size(); }

    /// @brief Row of dB magnitudes for one frame
    [[nodiscard]] const float* frame(size_t index) const noexcept {
        return magnitudesDb.data() + index * numBins();
    }

    [[nodiscard]] float at(size_t frameIndex, size_t bin) const noexcept {
        return magnitudesDb[frameIndex * numBins() + bin];
    }

    [[nodiscard]] bool empty() const noexcept { return times.empty(); }
};

// =============================================================================
// Generator
// =============================================================================

/// @brief STFT spectrogram generator.
///
/// Each instance owns its FFT state and scratch buffers. Instances are
/// independent and may run concurrently on separate threads.
///
/// @par Usage Example
/// @code
/// SpectrogramGenerator generator;
/// SpectrogramResult result;
/// if (!generator.generate(audio.mono.samples.data(), audio.mono.samples.size(),
///                         options, result)) {
///     std::cerr << generator.lastError() << "\n";
/// }
/// @endcode
class SpectrogramGenerator {
public:
    SpectrogramGenerator() = default;

    // Non-copyable, movable
    SpectrogramGenerator(const SpectrogramGenerator&) = delete;
    SpectrogramGenerator& operator=(const SpectrogramGenerator&) = delete;
    SpectrogramGenerator(SpectrogramGenerator&&) noexcept = default;
    SpectrogramGenerator& operator=(SpectrogramGenerator&&) noexcept = default;

    /// @brief Spectrogram of normalized PCM samples
    /// @return false on invalid input; result is left untouched
    [[nodiscard]] bool generate(const float* samples, size_t numSamples,
                                const SpectrogramOptions& options,
                                SpectrogramResult& result);

    /// @brief Spectrogram of dB metering readings
    /// @note NaN and -inf readings count as -160 dB; others are clamped to
    ///       [-160, 0] before conversion to linear amplitude
    [[nodiscard]] bool generateFromMetering(const float* dbValues, size_t count,
                                            const SpectrogramOptions& options,
                                            SpectrogramResult& result);

    [[nodiscard]] AnalysisError errorCode() const noexcept { return errorCode_; }
    [[nodiscard]] const std::string& lastError() const noexcept { return lastError_; }

    /// @brief Frames dropped because they ran past the input (last call)
    [[nodiscard]] size_t skippedFrames() const noexcept { return skippedFrames_; }

private:
    bool run(const float* samples, size_t numSamples,
             const SpectrogramOptions& options, SpectrogramResult& result);
    bool fail(AnalysisError error);

    SpectrumAnalyzer analyzer_;
    std::vector<float> padded_;
    std::vector<float> linear_;

    AnalysisError errorCode_ = AnalysisError::None;
    std::string lastError_;
    size_t skippedFrames_ = 0;
};

// =============================================================================
// Free Functions
// =============================================================================

/// @brief One-shot wrapper around SpectrogramGenerator::generate
[[nodiscard]] AnalysisError generateSpectrogram(const float* samples, size_t numSamples,
                                                const SpectrogramOptions& options,
                                                SpectrogramResult& result);

/// @brief One-shot wrapper around SpectrogramGenerator::generateFromMetering
[[nodiscard]] AnalysisError generateSpectrogramFromMetering(const float* dbValues, size_t count,
                                                            const SpectrogramOptions& options,
                                                            SpectrogramResult& result);

} // namespace DSP
} // namespace Sono
