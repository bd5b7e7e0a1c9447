// ==============================================================================
// Layer 3: System Component - Spectrum Snapshots Implementation
// ==============================================================================

#include "spectrum_snapshot.h"

#include <sono/dsp/core/db_utils.h>
#include <sono/dsp/core/spectral_simd.h>
#include <sono/dsp/primitives/fft.h>
#include <sono/dsp/processors/spectrum_analyzer.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Sono {
namespace DSP {

namespace {

bool isValidRate(double sampleRate) noexcept {
    return std::isfinite(sampleRate) && sampleRate > 0.0;
}

/// Windowed, gain-corrected spectrum of one segment.
/// FFT size is the smallest supported power of two holding the segment.
AnalysisError computeSnapshot(const float* segment, size_t length, WindowType window,
                              double sampleRate, SpectrumSnapshot& snapshot) {
    if (segment == nullptr || length == 0) {
        return AnalysisError::EmptyInput;
    }
    if (!isValidRate(sampleRate)) {
        return AnalysisError::InvalidSampleRate;
    }

    const size_t fftSize = fftSizeFor(length);

    SpectrumAnalyzer analyzer;
    if (!analyzer.prepare(fftSize, window, sampleRate)) {
        return AnalysisError::InvalidFFTSize;
    }

    SpectrumSnapshot out;
    out.spectrum.resize(analyzer.numBins());
    analyzer.analyze(segment, length, out.spectrum.data());

    const float gain = windowGain(window);
    batchScaleMagnitudes(out.spectrum.data(), out.spectrum.size(),
                         gain > 0.0f ? 1.0f / gain : 1.0f);

    out.frequencies = analyzer.frequencies();
    out.fftSize = fftSize;
    out.effectiveSampleRate = sampleRate;
    out.maxFreq = static_cast<double>(analyzer.numBins()) * sampleRate /
                  static_cast<double>(fftSize);
    out.windowType = window;

    snapshot = std::move(out);
    return AnalysisError::None;
}

} // anonymous namespace

// =============================================================================
// Time Slice
// =============================================================================

AnalysisError analyzeTimeSlice(const float* samples, size_t numSamples,
                               const SpectrogramResult& result, size_t frameIndex,
                               SpectrumSnapshot& snapshot) {
    const size_t frames = result.numFrames();
    if (frameIndex >= frames) {
        return AnalysisError::InvalidFrameIndex;
    }
    if (samples == nullptr || numSamples == 0) {
        return AnalysisError::EmptyInput;
    }

    // Frames are mapped onto the input by equal division, not by hop size
    const size_t samplesPerFrame = numSamples / frames;
    const size_t start = frameIndex * samplesPerFrame;
    if (start >= numSamples) {
        return AnalysisError::EmptyInput;
    }
    const size_t end = std::min(start + result.options.fftSize, numSamples);

    return computeSnapshot(samples + start, end - start, result.options.windowType,
                           result.options.samplingRate, snapshot);
}

AnalysisError analyzeTimeSliceFromSpectrogram(const SpectrogramResult& result,
                                              size_t frameIndex,
                                              SpectrumSnapshot& snapshot) {
    const size_t frames = result.numFrames();
    if (frameIndex >= frames) {
        return AnalysisError::InvalidFrameIndex;
    }
    if (result.numBins() == 0) {
        return AnalysisError::EmptyInput;
    }

    const size_t width = std::max(kMinFallbackFrames,
                                  static_cast<size_t>(std::floor(static_cast<double>(frames) * 0.05)));
    const size_t half = width / 2;
    const size_t first = frameIndex > half ? frameIndex - half : 0;
    const size_t last = std::min(frames - 1, frameIndex + half);

    std::vector<float> pseudo;
    pseudo.reserve(last - first + 1);
    for (size_t i = first; i <= last; ++i) {
        const float db = result.at(i, 0);
        pseudo.push_back(db <= kMeteringFloorDb ? 0.0f : dbToGain(db));
    }

    return computeSnapshot(pseudo.data(), pseudo.size(), result.options.windowType,
                           result.options.samplingRate, snapshot);
}

// =============================================================================
// Full Recording
// =============================================================================

size_t decimateMaxAbs(const float* samples, size_t numSamples, size_t maxSamples,
                      std::vector<float>& output) {
    if (samples == nullptr || numSamples == 0 || maxSamples == 0) {
        output.clear();
        return 1;
    }
    if (numSamples <= maxSamples) {
        output.assign(samples, samples + numSamples);
        return 1;
    }

    const size_t factor = (numSamples + maxSamples - 1) / maxSamples;
    output.assign(maxSamples, 0.0f);

    for (size_t i = 0; i < maxSamples; ++i) {
        const size_t begin = i * factor;
        const size_t end = std::min(numSamples, (i + 1) * factor);
        if (begin >= numSamples) {
            break;  // Tail past the input stays silent
        }

        float maxAbs = 0.0f;
        for (size_t j = begin; j < end; ++j) {
            maxAbs = std::max(maxAbs, std::abs(samples[j]));
        }

        const float first = samples[begin];
        const float sign = first > 0.0f ? 1.0f : (first < 0.0f ? -1.0f : 0.0f);
        output[i] = maxAbs * sign;
    }
    return factor;
}

std::vector<SpectrumPlotPoint> reduceForPlot(const std::vector<float>& spectrum,
                                             const std::vector<float>& frequencies,
                                             double minFreq, double maxFreq,
                                             size_t maxPoints) {
    const size_t bins = std::min(spectrum.size(), frequencies.size());

    std::vector<size_t> inRange;
    inRange.reserve(bins);
    for (size_t k = 0; k < bins; ++k) {
        const double f = frequencies[k];
        if (f >= minFreq && f <= maxFreq) {
            inRange.push_back(k);
        }
    }

    std::vector<SpectrumPlotPoint> points;
    if (inRange.empty()) {
        return points;
    }

    if (maxPoints == 0 || inRange.size() <= maxPoints) {
        points.reserve(inRange.size());
        for (const size_t k : inRange) {
            points.push_back({frequencies[k], spectrum[k]});
        }
        return points;
    }

    // Max-magnitude reduction keeps narrow peaks visible
    const size_t block = (inRange.size() + maxPoints - 1) / maxPoints;
    points.reserve(maxPoints);
    for (size_t i = 0; i < inRange.size(); i += block) {
        const size_t end = std::min(i + block, inRange.size());
        size_t best = inRange[i];
        for (size_t j = i + 1; j < end; ++j) {
            if (spectrum[inRange[j]] > spectrum[best]) {
                best = inRange[j];
            }
        }
        points.push_back({frequencies[best], spectrum[best]});
    }
    return points;
}

AnalysisError analyzeFullRecording(const float* samples, size_t numSamples,
                                   const SpectrogramOptions& options,
                                   SpectrumSnapshot& snapshot) {
    if (samples == nullptr || numSamples == 0) {
        return AnalysisError::EmptyInput;
    }
    if (!isValidRate(options.samplingRate)) {
        return AnalysisError::InvalidSampleRate;
    }

    std::vector<float> input;
    const size_t factor = decimateMaxAbs(samples, numSamples, kMaxFullSpectrumSamples, input);
    const double effectiveRate = options.samplingRate / static_cast<double>(factor);

    SpectrumSnapshot out;
    if (const AnalysisError error = computeSnapshot(input.data(), input.size(), options.windowType,
                                                    effectiveRate, out);
        error != AnalysisError::None) {
        return error;
    }
    out.decimationFactor = factor;

    const double maxFreq = options.maxFreq > 0.0 ? options.maxFreq : effectiveRate / 2.0;
    const double minFreq = options.minFreq > 0.0 ? options.minFreq : 0.0;
    out.plotPoints = reduceForPlot(out.spectrum, out.frequencies, minFreq, maxFreq);

    snapshot = std::move(out);
    return AnalysisError::None;
}

// =============================================================================
// Peaks
// =============================================================================

std::vector<SpectralPeak> findTopPeaks(const SpectrumSnapshot& snapshot, size_t count) {
    const size_t bins = std::min(snapshot.spectrum.size(), snapshot.frequencies.size());

    std::vector<size_t> order(bins);
    std::iota(order.begin(), order.end(), size_t{0});

    const size_t keep = std::min(count, bins);
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(keep), order.end(),
                      [&](size_t lhs, size_t rhs) {
                          if (snapshot.spectrum[lhs] != snapshot.spectrum[rhs]) {
                              return snapshot.spectrum[lhs] > snapshot.spectrum[rhs];
                          }
                          return lhs < rhs;
                      });

    std::vector<SpectralPeak> peaks;
    peaks.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        const size_t k = order[i];
        peaks.push_back({k, snapshot.frequencies[k], snapshot.spectrum[k]});
    }
    return peaks;
}

} // namespace DSP
} // namespace Sono
