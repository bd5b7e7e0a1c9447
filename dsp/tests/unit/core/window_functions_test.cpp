// ==============================================================================
// Layer 0: Core Utility Tests - Window Functions
// ==============================================================================
// Tests for: dsp/include/sono/dsp/core/window_functions.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <sono/dsp/core/window_functions.h>

#include <array>
#include <cmath>
#include <vector>

using namespace Sono::DSP;
using Catch::Approx;

namespace {

constexpr std::array<WindowType, kNumWindowTypes> kAllWindows = {
    WindowType::Hanning, WindowType::Hamming, WindowType::Blackman,
    WindowType::Bartlett, WindowType::Rectangular};

} // namespace

// ==============================================================================
// Shapes
// ==============================================================================

TEST_CASE("Rectangular window is all ones", "[window][rectangular]") {
    const auto w = Window::generate(WindowType::Rectangular, 256);
    REQUIRE(w.size() == 256);
    for (const float v : w) {
        REQUIRE(v == 1.0f);
    }
}

TEST_CASE("Hanning window endpoints and peak", "[window][hanning]") {
    const auto w = Window::generate(WindowType::Hanning, 1024);
    REQUIRE(w.front() == 0.0f);
    REQUIRE(w.back() == 0.0f);

    // Odd length has an exact center sample
    const auto odd = Window::generate(WindowType::Hanning, 9);
    REQUIRE(odd[4] == Approx(1.0f));
    REQUIRE(odd[2] == Approx(0.5f));
}

TEST_CASE("Hamming and Blackman endpoint values", "[window][hamming][blackman]") {
    const auto hamming = Window::generate(WindowType::Hamming, 64);
    REQUIRE(hamming.front() == Approx(0.08f));
    REQUIRE(hamming.back() == Approx(0.08f));

    const auto blackman = Window::generate(WindowType::Blackman, 64);
    REQUIRE(blackman.front() == Approx(0.0f).margin(1e-6));
    for (const float v : blackman) {
        REQUIRE(v >= 0.0f);
    }
}

TEST_CASE("Bartlett window is triangular", "[window][bartlett]") {
    const auto w = Window::generate(WindowType::Bartlett, 5);
    REQUIRE(w[0] == Approx(0.0f));
    REQUIRE(w[1] == Approx(0.5f));
    REQUIRE(w[2] == Approx(1.0f));
    REQUIRE(w[3] == Approx(0.5f));
    REQUIRE(w[4] == Approx(0.0f));
}

TEST_CASE("All windows are symmetric and bounded", "[window][symmetry]") {
    for (const auto type : kAllWindows) {
        INFO("window " << windowTypeName(type));
        const auto w = Window::generate(type, 255);
        for (size_t n = 0; n < w.size(); ++n) {
            REQUIRE(w[n] == w[w.size() - 1 - n]);
            REQUIRE(w[n] >= 0.0f);
            REQUIRE(w[n] <= 1.0f + 1e-6f);
        }
    }
}

TEST_CASE("Degenerate lengths", "[window][edge]") {
    for (const auto type : kAllWindows) {
        REQUIRE(Window::generate(type, 0).empty());
        const auto one = Window::generate(type, 1);
        REQUIRE(one.size() == 1);
        REQUIRE(one[0] == 1.0f);
    }
}

// ==============================================================================
// Gain and Names
// ==============================================================================

TEST_CASE("Window gain constants", "[window][gain]") {
    REQUIRE(windowGain(WindowType::Hanning) == 0.5f);
    REQUIRE(windowGain(WindowType::Hamming) == 0.54f);
    REQUIRE(windowGain(WindowType::Blackman) == 0.42f);
    REQUIRE(windowGain(WindowType::Bartlett) == 0.5f);
    REQUIRE(windowGain(WindowType::Rectangular) == 1.0f);
}

TEST_CASE("Window gain approximates the window mean", "[window][gain]") {
    for (const auto type : kAllWindows) {
        const auto w = Window::generate(type, 8192);
        double sum = 0.0;
        for (const float v : w) sum += v;
        const double mean = sum / static_cast<double>(w.size());
        REQUIRE(mean == Approx(windowGain(type)).epsilon(0.01));
    }
}

TEST_CASE("Window names parse back to their type", "[window][config]") {
    for (const auto type : kAllWindows) {
        REQUIRE(parseWindowType(windowTypeName(type)) == type);
    }
    REQUIRE(parseWindowType("hann") == WindowType::Hanning);
    REQUIRE(parseWindowType("kaiser") == WindowType::Rectangular);
}
