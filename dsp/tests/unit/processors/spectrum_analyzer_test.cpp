// ==============================================================================
// Layer 2: DSP Processor Tests - Single-Frame Spectrum Analyzer
// ==============================================================================
// Tests for: dsp/include/sono/dsp/processors/spectrum_analyzer.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <sono/dsp/processors/spectrum_analyzer.h>

#include "test_signals.h"

#include <vector>

using namespace Sono::DSP;
using Catch::Approx;

TEST_CASE("SpectrumAnalyzer prepare", "[analyzer][lifecycle]") {
    SpectrumAnalyzer analyzer;
    REQUIRE_FALSE(analyzer.isPrepared());

    SECTION("valid configuration builds the frequency axis") {
        REQUIRE(analyzer.prepare(1024, WindowType::Hanning, 48000.0));
        REQUIRE(analyzer.isPrepared());
        REQUIRE(analyzer.numBins() == 512);
        REQUIRE(analyzer.fftSize() == 1024);
        REQUIRE(analyzer.windowType() == WindowType::Hanning);
        REQUIRE(analyzer.sampleRate() == 48000.0);

        const auto& freqs = analyzer.frequencies();
        REQUIRE(freqs.size() == 512);
        REQUIRE(freqs[0] == 0.0f);
        REQUIRE(freqs[1] == Approx(46.875f));
        REQUIRE(freqs.back() == Approx(511.0f * 46.875f));
        for (size_t k = 1; k < freqs.size(); ++k) {
            REQUIRE(freqs[k] > freqs[k - 1]);
        }
    }

    SECTION("unsupported FFT size is rejected") {
        REQUIRE_FALSE(analyzer.prepare(1000, WindowType::Hanning, 44100.0));
        REQUIRE_FALSE(analyzer.isPrepared());
    }
}

TEST_CASE("SpectrumAnalyzer locates a sine", "[analyzer][peak]") {
    constexpr size_t N = 2048;
    constexpr double sampleRate = 44100.0;
    constexpr size_t targetBin = 93;
    const double frequency = static_cast<double>(targetBin) * sampleRate / N;

    for (const auto window : {WindowType::Hanning, WindowType::Hamming, WindowType::Blackman,
                              WindowType::Bartlett, WindowType::Rectangular}) {
        INFO("window " << windowTypeName(window));
        SpectrumAnalyzer analyzer;
        REQUIRE(analyzer.prepare(N, window, sampleRate));

        const auto input = TestHelpers::makeSine(N, frequency, sampleRate);
        std::vector<float> mags(analyzer.numBins());
        analyzer.analyze(input.data(), input.size(), mags.data());

        REQUIRE(TestHelpers::argMax(mags) == targetBin);
        // Coherent gain of the window scales the N/2 peak
        REQUIRE(mags[targetBin] == Approx(windowGain(window) * N / 2.0f).epsilon(0.02));
    }
}

TEST_CASE("SpectrumAnalyzer zero-pads short frames", "[analyzer][padding]") {
    SpectrumAnalyzer analyzer;
    REQUIRE(analyzer.prepare(64, WindowType::Rectangular, 8000.0));

    const auto input = TestHelpers::makeDC(16);
    std::vector<float> mags(analyzer.numBins());
    analyzer.analyze(input.data(), input.size(), mags.data());

    // Sum of the 16 ones lands in bin 0
    REQUIRE(mags[0] == Approx(16.0f).margin(1e-3));
}

TEST_CASE("SpectrumAnalyzer truncates long frames", "[analyzer][truncate]") {
    SpectrumAnalyzer analyzer;
    REQUIRE(analyzer.prepare(32, WindowType::Rectangular, 8000.0));

    const auto input = TestHelpers::makeDC(100);
    std::vector<float> mags(analyzer.numBins());
    analyzer.analyze(input.data(), input.size(), mags.data());

    REQUIRE(mags[0] == Approx(32.0f).margin(1e-3));
    REQUIRE(mags[1] == Approx(0.0f).margin(1e-4));
}

TEST_CASE("SpectrumAnalyzer repeated analysis is stable", "[analyzer][state]") {
    SpectrumAnalyzer analyzer;
    REQUIRE(analyzer.prepare(256, WindowType::Hanning, 44100.0));

    const auto input = TestHelpers::makeWhiteNoise(256);
    std::vector<float> first(analyzer.numBins());
    std::vector<float> second(analyzer.numBins());
    analyzer.analyze(input.data(), input.size(), first.data());
    analyzer.analyze(input.data(), input.size(), second.data());

    REQUIRE(first == second);
}
