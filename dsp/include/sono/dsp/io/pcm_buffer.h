// ==============================================================================
// IO: PCM Buffer
// ==============================================================================
// Normalized floating-point samples plus the format needed to interpret them.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Sono {
namespace DSP {

/// @brief Normalized PCM samples in [-1, 1], interleaved when multi-channel
struct PcmBuffer {
    std::vector<float> samples;
    double sampleRate = 0.0;
    uint16_t numChannels = 1;

    /// @brief Samples per channel
    [[nodiscard]] size_t numFrames() const noexcept {
        return numChannels > 0 ? samples.size() / numChannels : 0;
    }

    /// @brief Duration in seconds (0 when the rate is unknown)
    [[nodiscard]] double duration() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(numFrames()) / sampleRate : 0.0;
    }

    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
};

/// @brief How DecodedAudio::original is laid out
enum class ChannelLayout : uint8_t {
    Mono,        ///< One channel; original holds the same samples as mono
    Interleaved  ///< Frame-major interleaved channels
};

/// @brief Result of decoding a WAV container
struct DecodedAudio {
    PcmBuffer mono;             ///< Canonical mono view (channel average)
    PcmBuffer original;         ///< Decoded samples in their original layout
    ChannelLayout layout = ChannelLayout::Mono;

    uint32_t sampleRate = 0;
    uint16_t numChannels = 0;
    uint16_t bitsPerSample = 0;
    uint16_t audioFormat = 0;   ///< 1 = integer PCM, 3 = IEEE float
    size_t numSamples = 0;      ///< Per channel
    double duration = 0.0;      ///< Seconds

    /// Decoding stopped early because the data ran past the chunk or buffer
    bool truncated = false;
};

} // namespace DSP
} // namespace Sono
