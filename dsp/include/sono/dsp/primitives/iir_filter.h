// ==============================================================================
// Layer 1: DSP Primitive - Direct Form I IIR Filter
// ==============================================================================
// Arbitrary-order IIR filter driven by a {b, a} coefficient set:
//
//   y[n] = (sum_{k<M} b[k]*x[n-k] - sum_{1<=k<N} a[k]*y[n-k]) / a0
//
// Terms with a negative index are omitted, i.e. the filter starts from zero
// state and its start-up transient is reproduced. a0 is a[0] when it is
// non-zero, otherwise 1.
//
// Dependencies:
//   - stdlib: <vector>, <algorithm>, <cstddef>
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Sono {
namespace DSP {

// =============================================================================
// Coefficients
// =============================================================================

/// @brief Feedforward (b) and feedback (a) coefficient set
struct IIRCoefficients {
    std::vector<double> b;  ///< Numerator, b[0] applies to x[n]
    std::vector<double> a;  ///< Denominator, a[0] normalizes the recursion
};

/// @brief Non-fatal diagnostic for a coefficient set
enum class CoefficientStatus : uint8_t {
    Ok,                      ///< a[0] == 1
    LeadingFeedbackZero,     ///< a missing or a[0] == 0; treated as 1
    LeadingFeedbackNotUnity, ///< a[0] != 1; every output is divided by it
    Empty                    ///< b is empty; the filter outputs silence
};

/// @brief Inspect a coefficient set without building a filter
[[nodiscard]] inline CoefficientStatus checkCoefficients(const IIRCoefficients& c) noexcept {
    if (c.b.empty()) return CoefficientStatus::Empty;
    if (c.a.empty() || c.a[0] == 0.0) return CoefficientStatus::LeadingFeedbackZero;
    if (c.a[0] != 1.0) return CoefficientStatus::LeadingFeedbackNotUnity;
    return CoefficientStatus::Ok;
}

// =============================================================================
// DirectFormIFilter
// =============================================================================

/// @brief Stateful Direct Form I filter.
///
/// Histories are circular buffers sized to the coefficient counts, so one
/// instance handles any order. Products are accumulated in double precision;
/// the output history holds the float samples actually returned.
///
/// @par Usage Example
/// @code
/// DirectFormIFilter filter;
/// filter.setCoefficients(filterPreset(FilterPreset::DCBlocker));
/// filter.processBlock(input, output, numSamples);
/// @endcode
class DirectFormIFilter {
public:
    DirectFormIFilter() noexcept = default;

    /// @brief Install coefficients and clear state
    /// @return Diagnostic describing how a[0] will be interpreted
    /// @note NOT real-time safe (sizes history buffers)
    CoefficientStatus setCoefficients(const IIRCoefficients& coeffs) {
        b_ = coeffs.b;
        a_ = coeffs.a;
        status_ = checkCoefficients(coeffs);
        a0_ = (!a_.empty() && a_[0] != 0.0) ? a_[0] : 1.0;

        xHistory_.assign(b_.size(), 0.0f);
        yHistory_.assign(a_.size() > 1 ? a_.size() - 1 : 0, 0.0f);
        reset();
        return status_;
    }

    /// @brief Clear input/output history (back to zero initial state)
    void reset() noexcept {
        std::fill(xHistory_.begin(), xHistory_.end(), 0.0f);
        std::fill(yHistory_.begin(), yHistory_.end(), 0.0f);
        xPos_ = 0;
        yPos_ = 0;
    }

    /// @brief Filter one sample
    [[nodiscard]] float process(float x) noexcept {
        if (b_.empty()) return 0.0f;

        // x history: newest sample at xPos_, older samples walking backward
        xHistory_[xPos_] = x;

        const size_t M = xHistory_.size();
        double feedforward = 0.0;
        for (size_t k = 0; k < M; ++k) {
            const size_t idx = (xPos_ + M - k) % M;
            feedforward += b_[k] * static_cast<double>(xHistory_[idx]);
        }

        const size_t P = yHistory_.size();
        double feedback = 0.0;
        for (size_t k = 1; k <= P; ++k) {
            // y[n-k] lives k slots behind the next write position
            const size_t idx = (yPos_ + P - k) % P;
            feedback += a_[k] * static_cast<double>(yHistory_[idx]);
        }

        const auto y = static_cast<float>((feedforward - feedback) / a0_);

        xPos_ = (M > 0) ? (xPos_ + 1) % M : 0;
        if (P > 0) {
            yHistory_[yPos_] = y;
            yPos_ = (yPos_ + 1) % P;
        }
        return y;
    }

    /// @brief Filter a block (input and output may alias)
    void processBlock(const float* input, float* output, size_t numSamples) noexcept {
        if (input == nullptr || output == nullptr) return;
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process(input[i]);
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] CoefficientStatus status() const noexcept { return status_; }

    /// @brief Effective leading feedback coefficient (1 when a[0] is 0 or absent)
    [[nodiscard]] double leadingFeedback() const noexcept { return a0_; }

private:
    std::vector<double> b_;
    std::vector<double> a_;
    double a0_ = 1.0;
    CoefficientStatus status_ = CoefficientStatus::Empty;

    std::vector<float> xHistory_;
    std::vector<float> yHistory_;
    size_t xPos_ = 0;
    size_t yPos_ = 0;
};

// =============================================================================
// One-shot Filtering
// =============================================================================

/// @brief Filter a whole buffer from zero state into a new buffer
/// @param samples Input samples (not modified)
/// @param numSamples Input length
/// @param coeffs Coefficient set
/// @param status Optional out-parameter receiving the coefficient diagnostic
/// @return Filtered samples, same length as the input
[[nodiscard]] inline std::vector<float> applyIIRFilter(const float* samples, size_t numSamples,
                                                       const IIRCoefficients& coeffs,
                                                       CoefficientStatus* status = nullptr) {
    std::vector<float> output(numSamples, 0.0f);

    DirectFormIFilter filter;
    const CoefficientStatus s = filter.setCoefficients(coeffs);
    if (status != nullptr) *status = s;

    if (samples != nullptr) {
        filter.processBlock(samples, output.data(), numSamples);
    }
    return output;
}

} // namespace DSP
} // namespace Sono
