// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated real-to-complex FFT via pffft (Pretty Fast FFT).
// Uses SSE on x86/x64, NEON on ARM, with scalar fallback.
//
// Analysis only: the pipeline never resynthesizes audio, so only the forward
// transform is exposed.
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Sono {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft real transforms need N >= 32)
inline constexpr size_t kMinFFTSize = 32;

/// Maximum supported FFT size (matches the full-recording sample cap)
inline constexpr size_t kMaxFFTSize = size_t{1} << 20;

/// @brief True when size is a power of two in [kMinFFTSize, kMaxFFTSize]
[[nodiscard]] constexpr bool isValidFFTSize(size_t size) noexcept {
    return size >= kMinFFTSize && size <= kMaxFFTSize && std::has_single_bit(size);
}

/// @brief Smallest valid FFT size that holds `length` samples
/// @note Returns kMaxFFTSize for lengths above it; callers cap input first
[[nodiscard]] constexpr size_t fftSizeFor(size_t length) noexcept {
    if (length <= kMinFFTSize) return kMinFFTSize;
    if (length >= kMaxFFTSize) return kMaxFFTSize;
    return std::bit_ceil(length);
}

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT output
/// @note Layout is two floats so arrays can be read as interleaved re/im
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

static_assert(sizeof(Complex) == 2 * sizeof(float),
              "Complex must be layout-compatible with interleaved floats");

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Forward real FFT (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Power of 2 in range [32, 1048576]
    /// @return false if the size is unsupported or allocation failed
    /// @note NOT real-time safe (allocates memory)
    bool prepare(size_t fftSize) noexcept {
        size_ = 0;
        setup_.reset();

        if (!isValidFFTSize(fftSize)) {
            return false;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            return false;
        }

        // SIMD-aligned buffers (16-byte on SSE, as required by pffft)
        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) {
            setup_.reset();
            return false;
        }

        size_ = fftSize;
        return true;
    }

    /// @brief Reset internal work buffers
    void reset() noexcept {
        if (input_) std::fill_n(input_.get(), size_, 0.0f);
        if (output_) std::fill_n(output_.get(), size_, 0.0f);
        if (work_) std::fill_n(work_.get(), size_, 0.0f);
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist)
    /// @pre prepare() has returned true
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;

        std::copy_n(input, N, input_.get());

        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft: [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        // ours:  Complex[0]={DC,0}, Complex[k]={Re,Im}, Complex[N/2]={Nyq,0}
        const float* fftOut = output_.get();

        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};

        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size (0 when not prepared)
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    /// @brief Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer input_;   // Input staging
    detail::AlignedBuffer output_;  // Ordered spectrum
    detail::AlignedBuffer work_;    // pffft work buffer
};

} // namespace DSP
} // namespace Sono
