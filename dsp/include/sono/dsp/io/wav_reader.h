// ==============================================================================
// IO: WAV Container Reader
// ==============================================================================
// Parses RIFF/WAVE bytes into normalized PCM. Supports 8-bit unsigned,
// 16/24/32-bit signed integer and 32-bit IEEE float data, any channel count.
//
// Reads from a byte buffer only; callers own file access.
// ==============================================================================

#pragma once

#include <sono/dsp/core/analysis_error.h>
#include <sono/dsp/io/pcm_buffer.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Sono {
namespace DSP {

/// @brief WAV container parser.
///
/// Failures leave the output untouched and are reported through errorCode()
/// and lastError(). A read that stops early because the data chunk overruns
/// the buffer still succeeds, with DecodedAudio::truncated set.
///
/// @par Usage Example
/// @code
/// WavReader reader;
/// DecodedAudio audio;
/// if (!reader.read(bytes.data(), bytes.size(), audio)) {
///     std::cerr << reader.lastError() << "\n";
/// }
/// @endcode
class WavReader {
public:
    /// Offsets of the fields read from a "fmt " chunk, relative to the chunk id
    static constexpr size_t kFmtAudioFormatOffset = 8;
    static constexpr size_t kFmtChannelsOffset = 10;
    static constexpr size_t kFmtSampleRateOffset = 12;
    static constexpr size_t kFmtBitsPerSampleOffset = 22;

    /// Audio format codes
    static constexpr uint16_t kFormatPcm = 1;
    static constexpr uint16_t kFormatIeeeFloat = 3;

    /// @brief Decode a WAV buffer
    /// @return true on success (possibly truncated), false on error
    [[nodiscard]] bool read(const uint8_t* data, size_t size, DecodedAudio& out);

    [[nodiscard]] bool read(const std::vector<uint8_t>& bytes, DecodedAudio& out) {
        return read(bytes.data(), bytes.size(), out);
    }

    /// @brief Error code of the last read (None after success)
    [[nodiscard]] AnalysisError errorCode() const noexcept { return errorCode_; }

    /// @brief Message of the last read ("" after success)
    [[nodiscard]] const std::string& lastError() const noexcept { return lastError_; }

private:
    bool fail(AnalysisError error, const std::string& detail = {});

    AnalysisError errorCode_ = AnalysisError::None;
    std::string lastError_;
};

/// @brief Convenience wrapper around WavReader::read
[[nodiscard]] AnalysisError readWav(const uint8_t* data, size_t size, DecodedAudio& out);

} // namespace DSP
} // namespace Sono
