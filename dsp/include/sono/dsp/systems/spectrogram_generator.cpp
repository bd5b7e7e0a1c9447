// ==============================================================================
// Layer 3: System Component - Spectrogram Generator Implementation
// ==============================================================================

#include "spectrogram_generator.h"

#include <sono/dsp/core/db_utils.h>
#include <sono/dsp/core/spectral_simd.h>
#include <sono/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>

namespace Sono {
namespace DSP {

// =============================================================================
// Options
// =============================================================================

size_t SpectrogramOptions::hopSize() const noexcept {
    if (!std::isfinite(overlap) || overlap < 0.0 || overlap >= 1.0) {
        return 0;
    }
    return static_cast<size_t>(std::floor(static_cast<double>(fftSize) * (1.0 - overlap)));
}

AnalysisError validateOptions(const SpectrogramOptions& options) noexcept {
    if (!isValidFFTSize(options.fftSize)) {
        return AnalysisError::InvalidFFTSize;
    }
    if (options.hopSize() < 1) {
        return AnalysisError::InvalidOverlap;
    }
    if (!std::isfinite(options.samplingRate) || options.samplingRate <= 0.0) {
        return AnalysisError::InvalidSampleRate;
    }
    return AnalysisError::None;
}

// =============================================================================
// SpectrogramGenerator
// =============================================================================

bool SpectrogramGenerator::fail(AnalysisError error) {
    errorCode_ = error;
    lastError_ = std::string(describe(error));
    return false;
}

bool SpectrogramGenerator::generate(const float* samples, size_t numSamples,
                                    const SpectrogramOptions& options,
                                    SpectrogramResult& result) {
    if (samples == nullptr || numSamples == 0) {
        return fail(AnalysisError::EmptyInput);
    }
    return run(samples, numSamples, options, result);
}

bool SpectrogramGenerator::generateFromMetering(const float* dbValues, size_t count,
                                                const SpectrogramOptions& options,
                                                SpectrogramResult& result) {
    if (dbValues == nullptr || count == 0) {
        return fail(AnalysisError::EmptyInput);
    }
    if (const AnalysisError error = validateOptions(options); error != AnalysisError::None) {
        return fail(error);
    }

    linear_.resize(count);
    std::transform(dbValues, dbValues + count, linear_.begin(),
                   [](float db) { return meteringDbToGain(db); });

    return run(linear_.data(), count, options, result);
}

bool SpectrogramGenerator::run(const float* samples, size_t numSamples,
                               const SpectrogramOptions& options,
                               SpectrogramResult& result) {
    errorCode_ = AnalysisError::None;
    lastError_.clear();
    skippedFrames_ = 0;

    if (const AnalysisError error = validateOptions(options); error != AnalysisError::None) {
        return fail(error);
    }

    const size_t fftSize = options.fftSize;
    const size_t hop = options.hopSize();

    // Short inputs are zero-padded to one full frame
    if (numSamples < fftSize) {
        padded_.assign(fftSize, 0.0f);
        std::copy_n(samples, numSamples, padded_.begin());
        samples = padded_.data();
        numSamples = fftSize;
    }

    if (!analyzer_.isPrepared() || analyzer_.fftSize() != fftSize ||
        analyzer_.windowType() != options.windowType ||
        analyzer_.sampleRate() != options.samplingRate) {
        if (!analyzer_.prepare(fftSize, options.windowType, options.samplingRate)) {
            return fail(AnalysisError::InvalidFFTSize);
        }
    }

    const size_t totalFrames = std::max<size_t>(1, (numSamples - fftSize) / hop + 1);
    const double actualDuration = static_cast<double>(numSamples) / options.samplingRate;
    const size_t bins = analyzer_.numBins();

    SpectrogramResult out;
    out.frequencies = analyzer_.frequencies();
    out.magnitudesDb.resize(totalFrames * bins);
    out.times.reserve(totalFrames);

    size_t written = 0;
    for (size_t i = 0; i < totalFrames; ++i) {
        const size_t start = i * hop;
        if (start + fftSize > numSamples) {
            // Trailing partial frame: dropped, never padded
            ++skippedFrames_;
            continue;
        }

        float* row = out.magnitudesDb.data() + written * bins;
        analyzer_.analyze(samples + start, fftSize, row);
        batchMagnitudeToDb(row, row, bins);

        const double time = totalFrames > 1
            ? (static_cast<double>(i) / static_cast<double>(totalFrames - 1)) * actualDuration
            : actualDuration / 2.0;
        out.times.push_back(time);
        ++written;
    }
    out.magnitudesDb.resize(written * bins);

    out.options = options;
    out.options.duration = actualDuration;

    result = std::move(out);
    return true;
}

// =============================================================================
// Free Functions
// =============================================================================

AnalysisError generateSpectrogram(const float* samples, size_t numSamples,
                                  const SpectrogramOptions& options,
                                  SpectrogramResult& result) {
    SpectrogramGenerator generator;
    if (!generator.generate(samples, numSamples, options, result)) {
        return generator.errorCode();
    }
    return AnalysisError::None;
}

AnalysisError generateSpectrogramFromMetering(const float* dbValues, size_t count,
                                              const SpectrogramOptions& options,
                                              SpectrogramResult& result) {
    SpectrogramGenerator generator;
    if (!generator.generateFromMetering(dbValues, count, options, result)) {
        return generator.errorCode();
    }
    return AnalysisError::None;
}

} // namespace DSP
} // namespace Sono
