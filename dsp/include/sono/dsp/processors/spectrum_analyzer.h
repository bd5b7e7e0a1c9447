// ==============================================================================
// Layer 2: DSP Processor - Single-Frame Spectrum Analyzer
// ==============================================================================
// Windowed FFT magnitude of one analysis frame:
//   zero-pad or truncate to fftSize -> window -> forward real FFT ->
//   |X[k]| for k in [0, fftSize/2)
//
// The Nyquist bin is not reported. Magnitudes are raw (no window-gain
// correction); callers that want level-accurate spectra scale by
// 1/windowGain(type).
//
// Dependencies:
//   - Layer 0: window_functions.h, spectral_simd.h
//   - Layer 1: fft.h
// ==============================================================================

#pragma once

#include <sono/dsp/core/spectral_simd.h>
#include <sono/dsp/core/window_functions.h>
#include <sono/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Sono {
namespace DSP {

/// @brief Windowed single-frame magnitude spectrum
///
/// @par Usage Example
/// @code
/// SpectrumAnalyzer analyzer;
/// analyzer.prepare(1024, WindowType::Hanning, 44100.0);
/// std::vector<float> mags(analyzer.numBins());
/// analyzer.analyze(frame, frameLength, mags.data());
/// @endcode
class SpectrumAnalyzer {
public:
    SpectrumAnalyzer() noexcept = default;
    ~SpectrumAnalyzer() noexcept = default;

    // Non-copyable, movable
    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer(SpectrumAnalyzer&&) noexcept = default;
    SpectrumAnalyzer& operator=(SpectrumAnalyzer&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Allocate FFT state, window table and frequency axis
    /// @param fftSize Power of 2 in [kMinFFTSize, kMaxFFTSize]
    /// @param window Window applied to every frame
    /// @param sampleRate Sample rate in Hz, used for the frequency axis only
    /// @return false if fftSize is unsupported
    /// @note NOT real-time safe (allocates memory)
    bool prepare(size_t fftSize, WindowType window, double sampleRate) {
        fftSize_ = 0;
        if (!fft_.prepare(fftSize)) {
            return false;
        }

        windowType_ = window;
        sampleRate_ = sampleRate;
        window_ = Window::generate(window, fftSize);
        frame_.assign(fftSize, 0.0f);
        spectrum_.assign(fftSize / 2 + 1, Complex{});

        const size_t bins = fftSize / 2;
        const double deltaF = sampleRate / static_cast<double>(fftSize);
        frequencies_.resize(bins);
        for (size_t k = 0; k < bins; ++k) {
            frequencies_[k] = static_cast<float>(static_cast<double>(k) * deltaF);
        }

        fftSize_ = fftSize;
        return true;
    }

    /// @brief Clear scratch buffers
    void reset() noexcept {
        std::fill(frame_.begin(), frame_.end(), 0.0f);
        std::fill(spectrum_.begin(), spectrum_.end(), Complex{});
        fft_.reset();
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Magnitude spectrum of one frame
    /// @param frame Input samples (shorter frames are zero-padded,
    ///              longer frames truncated to fftSize)
    /// @param frameLength Number of input samples
    /// @param magnitudes Output, must hold numBins() floats
    void analyze(const float* frame, size_t frameLength, float* magnitudes) noexcept {
        if (!isPrepared() || magnitudes == nullptr) return;

        const size_t used = (frame == nullptr) ? 0 : std::min(frameLength, fftSize_);
        for (size_t i = 0; i < used; ++i) {
            frame_[i] = frame[i] * window_[i];
        }
        std::fill(frame_.begin() + static_cast<std::ptrdiff_t>(used), frame_.end(), 0.0f);

        fft_.forward(frame_.data(), spectrum_.data());

        computeMagnitudeBulk(reinterpret_cast<const float*>(spectrum_.data()),
                             numBins(), magnitudes);
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Number of reported bins (fftSize/2, Nyquist excluded)
    [[nodiscard]] size_t numBins() const noexcept { return fftSize_ / 2; }
    [[nodiscard]] size_t fftSize() const noexcept { return fftSize_; }
    [[nodiscard]] WindowType windowType() const noexcept { return windowType_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    /// @brief Bin center frequencies, k * sampleRate / fftSize
    [[nodiscard]] const std::vector<float>& frequencies() const noexcept { return frequencies_; }

    [[nodiscard]] bool isPrepared() const noexcept { return fftSize_ > 0; }

private:
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> frame_;
    std::vector<Complex> spectrum_;
    std::vector<float> frequencies_;
    WindowType windowType_ = WindowType::Hanning;
    double sampleRate_ = 0.0;
    size_t fftSize_ = 0;
};

} // namespace DSP
} // namespace Sono
