// ==============================================================================
// Layer 0: Core Utility - Axis Tick Generation
// ==============================================================================
// "Nice" tick positions for the frequency (or magnitude) axis and the time
// axis of a spectrogram. The last tick is always the axis maximum itself.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Sono {
namespace DSP {

/// @brief Tick values from 0 to maxVal with a 1-2-5 style step
/// @return {0} when maxVal <= 0
[[nodiscard]] inline std::vector<double> frequencyTicks(double maxVal) {
    if (!(maxVal > 0.0)) return {0.0};

    double step = 0.0;
    if (maxVal <= 1.0) step = 0.2;
    else if (maxVal <= 5.0) step = 1.0;
    else if (maxVal <= 10.0) step = 2.0;
    else if (maxVal <= 50.0) step = 10.0;
    else if (maxVal <= 100.0) step = 20.0;
    else if (maxVal <= 250.0) step = 50.0;
    else if (maxVal <= 500.0) step = 100.0;
    else if (maxVal <= 1000.0) step = 200.0;
    else step = std::pow(10.0, std::floor(std::log10(maxVal))) / 2.0;

    const double roundedMax = std::ceil(maxVal / step) * step;
    const auto numTicks = static_cast<size_t>(
        std::max(2.0, std::round(roundedMax / step) + 1.0));

    std::vector<double> ticks;
    ticks.reserve(numTicks + 1);
    for (size_t i = 0; i < numTicks; ++i) {
        ticks.push_back(static_cast<double>(i) * step);
    }
    if (ticks.back() < maxVal) {
        ticks.push_back(maxVal);
    }
    return ticks;
}

/// @brief Tick values in seconds from 0 to duration, clamped to duration
/// @return {0} when duration <= 0
[[nodiscard]] inline std::vector<double> timeTicks(double duration) {
    if (!(duration > 0.0)) return {0.0};

    double step = 0.0;
    if (duration <= 0.5) step = 0.1;
    else if (duration <= 1.0) step = 0.2;
    else if (duration <= 3.0) step = 0.5;
    else if (duration <= 10.0) step = 1.0;
    else step = std::ceil(duration / 10.0);

    const auto numTicks = static_cast<size_t>(std::floor(duration / step)) + 1;

    std::vector<double> ticks;
    ticks.reserve(numTicks + 1);
    for (size_t i = 0; i < numTicks; ++i) {
        ticks.push_back(std::min(static_cast<double>(i) * step, duration));
    }
    if (ticks.back() < duration) {
        ticks.push_back(duration);
    }
    return ticks;
}

} // namespace DSP
} // namespace Sono
