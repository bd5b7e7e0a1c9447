// ==============================================================================
// Layer 3: System Component - Spectrogram Display Decimation
// ==============================================================================
// Reduces a spectrogram to a bounded number of display cells. The time and
// frequency axes are decimated by the same step, sqrt of the overall factor,
// and each cell shows the mean dB value of the block it covers.
//
// Recordings shorter than one second are never decimated.
// ==============================================================================

#pragma once

#include <sono/dsp/core/db_utils.h>
#include <sono/dsp/systems/spectrogram_generator.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Sono {
namespace DSP {

/// Default bound on drawn cells
inline constexpr size_t kMaxDisplayCells = 7500;

/// @brief Decimation steps for a spectrogram of the given shape
struct DisplayDecimation {
    size_t baseFactor = 1;      ///< ceil(frames * bins / maxCells)
    size_t timeStep = 1;        ///< Frames per cell
    size_t freqStep = 1;        ///< Bins per cell
    size_t timePoints = 0;      ///< ceil(frames / timeStep)
    size_t freqPoints = 0;      ///< ceil(bins / freqStep)
};

[[nodiscard]] inline DisplayDecimation computeDisplayDecimation(size_t numFrames, size_t numBins,
                                                                double duration,
                                                                size_t maxCells = kMaxDisplayCells) noexcept {
    DisplayDecimation d;
    const size_t total = numFrames * numBins;
    if (maxCells > 0) {
        d.baseFactor = std::max<size_t>(1, (total + maxCells - 1) / maxCells);
    }

    const auto step = std::max<size_t>(
        1, static_cast<size_t>(std::floor(std::sqrt(static_cast<double>(d.baseFactor)))));
    d.timeStep = step;
    d.freqStep = step;

    if (duration > 0.0 && duration < 1.0) {
        d.timeStep = 1;
        d.freqStep = 1;
    }

    d.timePoints = (numFrames + d.timeStep - 1) / d.timeStep;
    d.freqPoints = (numBins + d.freqStep - 1) / d.freqStep;
    return d;
}

/// @brief Decimated cell grid, row-major (timeCells x freqCells)
struct DisplayGrid {
    std::vector<float> cellsDb;
    std::vector<double> times;        ///< Time of each cell row's anchor frame
    std::vector<float> frequencies;   ///< Frequency of each cell column's anchor bin
    size_t timeStep = 1;
    size_t freqStep = 1;

    [[nodiscard]] size_t numTimeCells() const noexcept { return times.size(); }
    [[nodiscard]] size_t numFreqCells() const noexcept { return frequencies.size(); }
    [[nodiscard]] float at(size_t t, size_t f) const noexcept {
        return cellsDb[t * numFreqCells() + f];
    }
};

/// @brief Build the display grid for the bins within [minFreq, maxFreq]
///
/// Columns are anchored at every freqStep-th in-range bin and rows at every
/// timeStep-th frame. A cell averages the finite values of its block whose
/// bins are in range; a cell with none reads kMeteringFloorDb.
[[nodiscard]] inline DisplayGrid buildDisplayGrid(const SpectrogramResult& result,
                                                  const DisplayDecimation& decimation,
                                                  double minFreq, double maxFreq) {
    DisplayGrid grid;
    grid.timeStep = std::max<size_t>(1, decimation.timeStep);
    grid.freqStep = std::max<size_t>(1, decimation.freqStep);

    const size_t frames = result.numFrames();
    const size_t bins = result.numBins();

    // In-range bins form one contiguous run because frequencies increase
    size_t firstBin = bins;
    size_t lastBin = 0;
    for (size_t k = 0; k < bins; ++k) {
        const double f = result.frequencies[k];
        if (f >= minFreq && f <= maxFreq) {
            firstBin = std::min(firstBin, k);
            lastBin = k;
        }
    }
    if (firstBin == bins || frames == 0) {
        return grid;
    }

    std::vector<size_t> anchors;
    for (size_t k = firstBin; k <= lastBin; k += grid.freqStep) {
        anchors.push_back(k);
        grid.frequencies.push_back(result.frequencies[k]);
    }

    for (size_t t = 0; t < frames; t += grid.timeStep) {
        grid.times.push_back(result.times[t]);
        const size_t tEnd = std::min(frames, t + grid.timeStep);

        for (const size_t anchor : anchors) {
            const size_t fEnd = std::min({bins, anchor + grid.freqStep, lastBin + 1});
            double sum = 0.0;
            size_t count = 0;
            for (size_t ti = t; ti < tEnd; ++ti) {
                const float* row = result.frame(ti);
                for (size_t k = anchor; k < fEnd; ++k) {
                    if (std::isfinite(row[k])) {
                        sum += row[k];
                        ++count;
                    }
                }
            }
            grid.cellsDb.push_back(count > 0 ? static_cast<float>(sum / static_cast<double>(count))
                                             : kMeteringFloorDb);
        }
    }
    return grid;
}

} // namespace DSP
} // namespace Sono
