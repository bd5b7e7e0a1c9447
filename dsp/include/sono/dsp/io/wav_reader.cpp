// ==============================================================================
// IO: WAV Container Reader Implementation
// ==============================================================================

#include "wav_reader.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <optional>

namespace Sono {
namespace DSP {

namespace {

// Little-endian field readers. Callers guarantee the bytes are in range.

uint16_t readU16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool hasId(const uint8_t* p, const char (&id)[5]) noexcept {
    return std::memcmp(p, id, 4) == 0;
}

struct ChunkLocation {
    size_t offset = 0;  // Offset of the chunk id
    uint32_t size = 0;  // Declared payload size
};

/// Walk the chunk list from offset 12 until `id` is found.
/// The walk continues while at least a full 8-byte header remains.
std::optional<ChunkLocation> findChunk(const uint8_t* data, size_t size,
                                       const char (&id)[5]) noexcept {
    uint64_t offset = 12;
    while (offset + 8 < size) {
        const auto pos = static_cast<size_t>(offset);
        const uint32_t chunkSize = readU32(data + pos + 4);
        if (hasId(data + pos, id)) {
            return ChunkLocation{pos, chunkSize};
        }
        // Chunks are word-aligned: odd sizes carry one pad byte
        offset += 8 + static_cast<uint64_t>(chunkSize) + (chunkSize & 1u);
    }
    return std::nullopt;
}

/// Decode one sample at p. bits/format have been validated by the caller.
float decodeSample(const uint8_t* p, uint16_t bits, uint16_t format) noexcept {
    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(readU16(p))) / 32768.0f;
        case 24: {
            int32_t v = static_cast<int32_t>(p[0]) |
                        (static_cast<int32_t>(p[1]) << 8) |
                        (static_cast<int32_t>(p[2]) << 16);
            if (v & 0x800000) {
                v -= 0x1000000;  // Sign-extend bit 23
            }
            return static_cast<float>(v / 8388608.0);
        }
        case 32:
        default:
            if (format == WavReader::kFormatPcm) {
                const auto v = static_cast<int32_t>(readU32(p));
                return static_cast<float>(v / 2147483648.0);
            }
            {
                const float f = std::bit_cast<float>(readU32(p));
                return std::isnan(f) ? 0.0f : f;
            }
    }
}

} // anonymous namespace

bool WavReader::fail(AnalysisError error, const std::string& detail) {
    errorCode_ = error;
    lastError_ = std::string(describe(error));
    if (!detail.empty()) {
        lastError_ += " (" + detail + ")";
    }
    return false;
}

bool WavReader::read(const uint8_t* data, size_t size, DecodedAudio& out) {
    errorCode_ = AnalysisError::None;
    lastError_.clear();

    // -------------------------------------------------------------------------
    // RIFF/WAVE header
    // -------------------------------------------------------------------------

    if (data == nullptr || size < 12) {
        return fail(AnalysisError::InvalidRiffHeader, "buffer shorter than 12 bytes");
    }
    if (!hasId(data, "RIFF")) {
        return fail(AnalysisError::InvalidRiffHeader);
    }
    if (!hasId(data + 8, "WAVE")) {
        return fail(AnalysisError::InvalidWaveFormat);
    }

    // -------------------------------------------------------------------------
    // "fmt " chunk
    // -------------------------------------------------------------------------

    const auto fmt = findChunk(data, size, "fmt ");
    if (!fmt || fmt->offset + kFmtBitsPerSampleOffset + 2 > size) {
        return fail(AnalysisError::MissingFormatChunk);
    }

    const uint8_t* fmtBase = data + fmt->offset;
    const uint16_t audioFormat = readU16(fmtBase + kFmtAudioFormatOffset);
    const uint16_t numChannels = readU16(fmtBase + kFmtChannelsOffset);
    const uint32_t sampleRate = readU32(fmtBase + kFmtSampleRateOffset);
    const uint16_t bitsPerSample = readU16(fmtBase + kFmtBitsPerSampleOffset);

    // -------------------------------------------------------------------------
    // "data" chunk (scanned independently; may precede "fmt ")
    // -------------------------------------------------------------------------

    const auto dataChunk = findChunk(data, size, "data");
    if (!dataChunk) {
        return fail(AnalysisError::MissingDataChunk);
    }

    if (numChannels == 0 || sampleRate == 0) {
        return fail(AnalysisError::InvalidFormatFields,
                    "channels=" + std::to_string(numChannels) +
                    " sampleRate=" + std::to_string(sampleRate));
    }

    if (bitsPerSample != 8 && bitsPerSample != 16 &&
        bitsPerSample != 24 && bitsPerSample != 32) {
        return fail(AnalysisError::UnsupportedBitDepth,
                    std::to_string(bitsPerSample) + " bits");
    }
    if (bitsPerSample == 32 && audioFormat != kFormatPcm && audioFormat != kFormatIeeeFloat) {
        return fail(AnalysisError::UnsupportedAudioFormat,
                    "format " + std::to_string(audioFormat));
    }

    const size_t bytesPerSample = bitsPerSample / 8u;
    const size_t dataOffset = dataChunk->offset + 8;
    const size_t declaredSize = dataChunk->size;
    const size_t totalSamples = declaredSize / bytesPerSample;

    if (totalSamples == 0) {
        return fail(AnalysisError::EmptyDataChunk);
    }

    // -------------------------------------------------------------------------
    // Sample decoding
    // -------------------------------------------------------------------------

    const uint64_t dataEnd = static_cast<uint64_t>(dataOffset) + declaredSize;

    std::vector<float> decoded;
    decoded.reserve(std::min<uint64_t>(totalSamples, size / bytesPerSample));

    bool truncated = false;
    for (size_t i = 0; i < totalSamples; ++i) {
        const uint64_t byteOffset = static_cast<uint64_t>(dataOffset) + i * bytesPerSample;
        if (byteOffset + bytesPerSample > dataEnd || byteOffset + bytesPerSample > size) {
            truncated = true;
            break;
        }
        const float value = decodeSample(data + byteOffset, bitsPerSample, audioFormat);
        decoded.push_back(std::clamp(value, -1.0f, 1.0f));
    }

    const size_t perChannel = decoded.size() / numChannels;

    // -------------------------------------------------------------------------
    // Channel layout and mono view
    // -------------------------------------------------------------------------

    DecodedAudio result;
    result.sampleRate = sampleRate;
    result.numChannels = numChannels;
    result.bitsPerSample = bitsPerSample;
    result.audioFormat = audioFormat;
    result.numSamples = perChannel;
    result.duration = static_cast<double>(perChannel) / static_cast<double>(sampleRate);
    result.truncated = truncated;
    result.layout = numChannels > 1 ? ChannelLayout::Interleaved : ChannelLayout::Mono;

    result.original.sampleRate = sampleRate;
    result.original.numChannels = numChannels;
    result.mono.sampleRate = sampleRate;
    result.mono.numChannels = 1;

    if (numChannels > 1) {
        result.mono.samples.resize(perChannel);
        for (size_t frame = 0; frame < perChannel; ++frame) {
            float sum = 0.0f;
            for (size_t ch = 0; ch < numChannels; ++ch) {
                sum += decoded[frame * numChannels + ch];
            }
            result.mono.samples[frame] = sum / static_cast<float>(numChannels);
        }
    } else {
        result.mono.samples = decoded;
    }
    result.original.samples = std::move(decoded);

    out = std::move(result);
    return true;
}

AnalysisError readWav(const uint8_t* data, size_t size, DecodedAudio& out) {
    WavReader reader;
    if (!reader.read(data, size, out)) {
        return reader.errorCode();
    }
    return AnalysisError::None;
}

} // namespace DSP
} // namespace Sono
