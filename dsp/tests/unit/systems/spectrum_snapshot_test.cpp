// ==============================================================================
// Layer 3: System Tests - Spectrum Snapshots
// ==============================================================================
// Tests for: dsp/include/sono/dsp/systems/spectrum_snapshot.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <sono/dsp/systems/spectrum_snapshot.h>

#include "test_signals.h"

#include <cmath>
#include <vector>

using namespace Sono::DSP;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 8000.0;

SpectrogramOptions sliceOptions() {
    SpectrogramOptions options;
    options.samplingRate = kSampleRate;
    options.fftSize = 256;
    options.overlap = 0.5;
    return options;
}

} // namespace

// ==============================================================================
// Time Slice
// ==============================================================================

TEST_CASE("Time slice of a sine", "[snapshot][slice]") {
    const auto input = TestHelpers::makeSine(8000, 1000.0, kSampleRate);
    SpectrogramResult result;
    REQUIRE(generateSpectrogram(input.data(), input.size(), sliceOptions(), result) ==
            AnalysisError::None);

    SpectrumSnapshot snapshot;
    REQUIRE(analyzeTimeSlice(input.data(), input.size(), result, 10, snapshot) ==
            AnalysisError::None);

    REQUIRE(snapshot.fftSize == 256);
    REQUIRE(snapshot.spectrum.size() == 128);
    REQUIRE(snapshot.frequencies.size() == 128);
    REQUIRE(snapshot.windowType == WindowType::Hanning);
    REQUIRE(snapshot.maxFreq == Approx(4000.0));

    // 1000 Hz is bin 32; window gain correction restores the N/2 peak
    const size_t peak = TestHelpers::argMax(snapshot.spectrum);
    REQUIRE(peak == 32);
    REQUIRE(snapshot.spectrum[peak] == Approx(128.0f).epsilon(0.02));
}

TEST_CASE("Time slice at the end of the input is shortened", "[snapshot][slice]") {
    const auto input = TestHelpers::makeWhiteNoise(1000);
    SpectrogramOptions options = sliceOptions();
    SpectrogramResult result;
    REQUIRE(generateSpectrogram(input.data(), input.size(), options, result) ==
            AnalysisError::None);
    REQUIRE(result.numFrames() == 6);

    // samplesPerFrame = 166; frame 5 starts at 830, leaving 170 samples
    SpectrumSnapshot snapshot;
    REQUIRE(analyzeTimeSlice(input.data(), input.size(), result, 5, snapshot) ==
            AnalysisError::None);
    REQUIRE(snapshot.fftSize == 256);
}

TEST_CASE("Time slice errors", "[snapshot][slice][error]") {
    const auto input = TestHelpers::makeWhiteNoise(1024);
    SpectrogramResult result;
    REQUIRE(generateSpectrogram(input.data(), input.size(), sliceOptions(), result) ==
            AnalysisError::None);

    SpectrumSnapshot snapshot;
    snapshot.fftSize = 7;

    REQUIRE(analyzeTimeSlice(input.data(), input.size(), result, result.numFrames(), snapshot) ==
            AnalysisError::InvalidFrameIndex);
    REQUIRE(analyzeTimeSlice(nullptr, 0, result, 0, snapshot) == AnalysisError::EmptyInput);
    REQUIRE(snapshot.fftSize == 7);

    SpectrogramResult empty;
    REQUIRE(analyzeTimeSlice(input.data(), input.size(), empty, 0, snapshot) ==
            AnalysisError::InvalidFrameIndex);
}

TEST_CASE("Time slice fallback from spectrogram data", "[snapshot][fallback]") {
    const auto input = TestHelpers::makeWhiteNoise(8000);
    SpectrogramResult result;
    REQUIRE(generateSpectrogram(input.data(), input.size(), sliceOptions(), result) ==
            AnalysisError::None);
    REQUIRE(result.numFrames() == 61);

    SECTION("neighbourhood clamped at the start") {
        // width 10, half 5: frames 0..5
        SpectrumSnapshot snapshot;
        REQUIRE(analyzeTimeSliceFromSpectrogram(result, 0, snapshot) == AnalysisError::None);
        REQUIRE(snapshot.fftSize == kMinFFTSize);
        REQUIRE(snapshot.spectrum.size() == kMinFFTSize / 2);
    }

    SECTION("out of range frame") {
        SpectrumSnapshot snapshot;
        REQUIRE(analyzeTimeSliceFromSpectrogram(result, 61, snapshot) ==
                AnalysisError::InvalidFrameIndex);
    }

    SECTION("silent lowest bins give a silent spectrum") {
        SpectrogramResult silent = result;
        for (size_t i = 0; i < silent.numFrames(); ++i) {
            silent.magnitudesDb[i * silent.numBins()] = -170.0f;
        }
        SpectrumSnapshot snapshot;
        REQUIRE(analyzeTimeSliceFromSpectrogram(silent, 30, snapshot) == AnalysisError::None);
        for (const float m : snapshot.spectrum) {
            REQUIRE(m == 0.0f);
        }
    }
}

// ==============================================================================
// Full Recording
// ==============================================================================

TEST_CASE("Peak-preserving decimation", "[snapshot][decimate]") {
    const std::vector<float> input = {1.0f, -3.0f, 2.0f, -1.0f, 0.5f, 0.2f, -0.4f};
    std::vector<float> output;

    SECTION("input that fits is copied") {
        REQUIRE(decimateMaxAbs(input.data(), input.size(), 7, output) == 1);
        REQUIRE(output == input);
    }

    SECTION("block maximum carries the sign of the block's first sample") {
        REQUIRE(decimateMaxAbs(input.data(), input.size(), 3, output) == 3);
        REQUIRE(output == std::vector<float>{3.0f, -1.0f, -0.4f});
    }

    SECTION("blocks past the input stay silent") {
        const std::vector<float> ones(9, 1.0f);
        // factor 3 over 4 outputs: the fourth block starts at 9
        REQUIRE(decimateMaxAbs(ones.data(), ones.size(), 4, output) == 3);
        REQUIRE(output == std::vector<float>{1.0f, 1.0f, 1.0f, 0.0f});
    }
}

TEST_CASE("Plot reduction keeps loud bins", "[snapshot][plot]") {
    std::vector<float> spectrum(1000, 0.1f);
    std::vector<float> freqs(1000);
    for (size_t k = 0; k < freqs.size(); ++k) {
        freqs[k] = static_cast<float>(k) * 10.0f;
    }
    spectrum[503] = 9.0f;

    SECTION("reduced to the point budget") {
        const auto points = reduceForPlot(spectrum, freqs, 0.0, 1e9);
        REQUIRE(points.size() == kMaxSpectrumPlotPoints);

        bool foundPeak = false;
        for (const auto& p : points) {
            if (p.magnitude == 9.0f) {
                foundPeak = true;
                REQUIRE(p.frequency == 5030.0f);
            }
        }
        REQUIRE(foundPeak);
    }

    SECTION("frequency range filter") {
        const auto points = reduceForPlot(spectrum, freqs, 1000.0, 1500.0);
        REQUIRE(points.size() == 51);
        REQUIRE(points.front().frequency == 1000.0f);
        REQUIRE(points.back().frequency == 1500.0f);
    }

    SECTION("empty range") {
        REQUIRE(reduceForPlot(spectrum, freqs, 20000.0, 30000.0).empty());
    }
}

TEST_CASE("Full recording spectrum of a sine", "[snapshot][full]") {
    const auto input = TestHelpers::makeSine(8000, 1000.0, kSampleRate);
    SpectrogramOptions options = sliceOptions();

    SpectrumSnapshot snapshot;
    REQUIRE(analyzeFullRecording(input.data(), input.size(), options, snapshot) ==
            AnalysisError::None);

    REQUIRE(snapshot.fftSize == 8192);
    REQUIRE(snapshot.decimationFactor == 1);
    REQUIRE(snapshot.effectiveSampleRate == kSampleRate);
    REQUIRE(snapshot.maxFreq == Approx(4000.0));
    REQUIRE_FALSE(snapshot.plotPoints.empty());
    REQUIRE(snapshot.plotPoints.size() <= kMaxSpectrumPlotPoints);

    const auto peaks = findTopPeaks(snapshot, 1);
    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].frequency == Approx(1000.0f).margin(2.0f));
}

TEST_CASE("Full recording honours the display range", "[snapshot][full]") {
    const auto input = TestHelpers::makeWhiteNoise(4096);
    SpectrogramOptions options = sliceOptions();
    options.minFreq = 500.0;
    options.maxFreq = 600.0;

    SpectrumSnapshot snapshot;
    REQUIRE(analyzeFullRecording(input.data(), input.size(), options, snapshot) ==
            AnalysisError::None);
    for (const auto& p : snapshot.plotPoints) {
        REQUIRE(p.frequency >= 500.0f);
        REQUIRE(p.frequency <= 600.0f);
    }
}

TEST_CASE("Long recordings are decimated", "[snapshot][full][decimate]") {
    const auto input = TestHelpers::makeSine(kMaxFullSpectrumSamples + 100, 100.0, 44100.0);
    SpectrogramOptions options;

    SpectrumSnapshot snapshot;
    REQUIRE(analyzeFullRecording(input.data(), input.size(), options, snapshot) ==
            AnalysisError::None);
    REQUIRE(snapshot.decimationFactor == 2);
    REQUIRE(snapshot.effectiveSampleRate == Approx(22050.0));
    REQUIRE(snapshot.fftSize == kMaxFFTSize);
    REQUIRE(snapshot.maxFreq == Approx(11025.0));
}

TEST_CASE("Full recording errors", "[snapshot][full][error]") {
    SpectrogramOptions options = sliceOptions();
    SpectrumSnapshot snapshot;
    REQUIRE(analyzeFullRecording(nullptr, 0, options, snapshot) == AnalysisError::EmptyInput);

    const std::vector<float> input(64, 0.1f);
    options.samplingRate = 0.0;
    REQUIRE(analyzeFullRecording(input.data(), input.size(), options, snapshot) ==
            AnalysisError::InvalidSampleRate);
}

// ==============================================================================
// Peaks
// ==============================================================================

TEST_CASE("Top peaks are ordered by magnitude", "[snapshot][peaks]") {
    SpectrumSnapshot snapshot;
    snapshot.spectrum = {1.0f, 5.0f, 3.0f, 5.0f, 2.0f};
    snapshot.frequencies = {0.0f, 10.0f, 20.0f, 30.0f, 40.0f};

    const auto peaks = findTopPeaks(snapshot);
    REQUIRE(peaks.size() == 3);
    REQUIRE(peaks[0].bin == 1);
    REQUIRE(peaks[1].bin == 3);
    REQUIRE(peaks[2].bin == 2);
    REQUIRE(peaks[2].frequency == 20.0f);

    REQUIRE(findTopPeaks(snapshot, 10).size() == 5);
    REQUIRE(findTopPeaks(SpectrumSnapshot{}).empty());
}
