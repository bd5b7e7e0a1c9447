#pragma once
// ==============================================================================
// WAV Byte Builder
// ==============================================================================
// Assembles RIFF/WAVE byte buffers for reader tests. The library never writes
// WAV; this exists only so tests can describe containers precisely, including
// malformed ones.
// ==============================================================================

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace TestHelpers {

class WavBuilder {
public:
    WavBuilder& format(uint16_t audioFormat, uint16_t channels,
                       uint32_t sampleRate, uint16_t bitsPerSample) {
        audioFormat_ = audioFormat;
        channels_ = channels;
        sampleRate_ = sampleRate;
        bits_ = bitsPerSample;
        return *this;
    }

    /// Raw data chunk payload
    WavBuilder& data(std::vector<uint8_t> bytes) {
        data_ = std::move(bytes);
        return *this;
    }

    /// Override the size field of the data chunk (to simulate truncation)
    WavBuilder& declaredDataSize(uint32_t size) {
        declaredDataSize_ = size;
        hasDeclaredDataSize_ = true;
        return *this;
    }

    /// Insert an unrelated chunk before "fmt "
    WavBuilder& extraChunk(const std::string& id, std::vector<uint8_t> payload) {
        extraId_ = id;
        extra_ = std::move(payload);
        return *this;
    }

    WavBuilder& omitFormatChunk() { omitFmt_ = true; return *this; }
    WavBuilder& omitDataChunk() { omitData_ = true; return *this; }
    WavBuilder& dataBeforeFormat() { dataFirst_ = true; return *this; }

    [[nodiscard]] std::vector<uint8_t> build() const {
        std::vector<uint8_t> out;
        appendId(out, "RIFF");
        appendU32(out, 0);  // Patched below
        appendId(out, "WAVE");

        if (!extraId_.empty()) {
            appendId(out, extraId_);
            appendU32(out, static_cast<uint32_t>(extra_.size()));
            out.insert(out.end(), extra_.begin(), extra_.end());
            if (extra_.size() % 2 != 0) out.push_back(0);
        }

        if (dataFirst_) {
            appendData(out);
            appendFmt(out);
        } else {
            appendFmt(out);
            appendData(out);
        }

        const auto riffSize = static_cast<uint32_t>(out.size() - 8);
        for (int i = 0; i < 4; ++i) {
            out[4 + i] = static_cast<uint8_t>((riffSize >> (8 * i)) & 0xFF);
        }
        return out;
    }

    // -------------------------------------------------------------------------
    // Sample encoders
    // -------------------------------------------------------------------------

    static std::vector<uint8_t> encodePcm16(const std::vector<float>& samples) {
        std::vector<uint8_t> bytes;
        for (const float s : samples) {
            const auto v = static_cast<int16_t>(
                std::clamp(std::lround(s * 32768.0f), -32768L, 32767L));
            appendU16(bytes, static_cast<uint16_t>(v));
        }
        return bytes;
    }

    static std::vector<uint8_t> encodeFloat32(const std::vector<float>& samples) {
        std::vector<uint8_t> bytes;
        for (const float s : samples) {
            appendU32(bytes, std::bit_cast<uint32_t>(s));
        }
        return bytes;
    }

    static std::vector<uint8_t> encodeInt24(const std::vector<int32_t>& values) {
        std::vector<uint8_t> bytes;
        for (const int32_t v : values) {
            const auto u = static_cast<uint32_t>(v);
            bytes.push_back(static_cast<uint8_t>(u & 0xFF));
            bytes.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
            bytes.push_back(static_cast<uint8_t>((u >> 16) & 0xFF));
        }
        return bytes;
    }

    static std::vector<uint8_t> encodeInt32(const std::vector<int32_t>& values) {
        std::vector<uint8_t> bytes;
        for (const int32_t v : values) {
            appendU32(bytes, static_cast<uint32_t>(v));
        }
        return bytes;
    }

    static void appendU16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }

    static void appendU32(std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

private:
    static void appendId(std::vector<uint8_t>& out, const std::string& id) {
        for (size_t i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>(i < id.size() ? id[i] : ' '));
        }
    }

    void appendFmt(std::vector<uint8_t>& out) const {
        if (omitFmt_) return;
        appendId(out, "fmt ");
        appendU32(out, 16);
        appendU16(out, audioFormat_);
        appendU16(out, channels_);
        appendU32(out, sampleRate_);
        const uint16_t blockAlign = static_cast<uint16_t>(channels_ * (bits_ / 8));
        appendU32(out, sampleRate_ * blockAlign);
        appendU16(out, blockAlign);
        appendU16(out, bits_);
    }

    void appendData(std::vector<uint8_t>& out) const {
        if (omitData_) return;
        appendId(out, "data");
        appendU32(out, hasDeclaredDataSize_ ? declaredDataSize_
                                            : static_cast<uint32_t>(data_.size()));
        out.insert(out.end(), data_.begin(), data_.end());
    }

    uint16_t audioFormat_ = 1;
    uint16_t channels_ = 1;
    uint32_t sampleRate_ = 44100;
    uint16_t bits_ = 16;
    std::vector<uint8_t> data_;
    uint32_t declaredDataSize_ = 0;
    bool hasDeclaredDataSize_ = false;
    std::string extraId_;
    std::vector<uint8_t> extra_;
    bool omitFmt_ = false;
    bool omitData_ = false;
    bool dataFirst_ = false;
};

} // namespace TestHelpers
