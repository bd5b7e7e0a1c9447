// ==============================================================================
// Layer 0: Core Utility - Analysis Error Codes
// ==============================================================================
// Status codes shared by the WAV reader, the spectrogram generator and the
// spectrum snapshot analyzers. Functions report failure through these codes
// (plus a descriptive lastError() string where a class is involved); the
// library does not throw.
//
// Errors are deterministic for a given input, so callers should surface them
// rather than retry.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace Sono {
namespace DSP {

// =============================================================================
// Error Enumerations
// =============================================================================

/// @brief Broad failure class, used by callers to pick a user-facing response
enum class ErrorCategory : uint8_t {
    None,               ///< Success
    Format,             ///< Not a readable RIFF/WAVE container; discard the file
    UnsupportedFormat,  ///< Valid container, exotic encoding; transcode externally
    InvalidInput        ///< Bad arguments to an analysis call
};

/// @brief Specific failure reason
enum class AnalysisError : uint8_t {
    None,

    // Format
    InvalidRiffHeader,     ///< Buffer does not start with "RIFF"
    InvalidWaveFormat,     ///< Bytes 8..11 are not "WAVE"
    MissingFormatChunk,    ///< No complete "fmt " chunk
    MissingDataChunk,      ///< No "data" chunk
    InvalidFormatFields,   ///< Zero channels or zero sample rate
    EmptyDataChunk,        ///< Data chunk holds no complete sample frame

    // UnsupportedFormat
    UnsupportedBitDepth,    ///< Bits per sample not in {8, 16, 24, 32}
    UnsupportedAudioFormat, ///< 32-bit data with a format code other than 1 or 3

    // InvalidInput
    EmptyInput,         ///< Zero-length sample or metering input
    InvalidFFTSize,     ///< FFT size not a supported power of two
    InvalidOverlap,     ///< Overlap outside [0, 1) or hop size below one sample
    InvalidSampleRate,  ///< Sample rate <= 0 or not finite
    InvalidFrameIndex   ///< Time-slice index past the last spectrogram frame
};

// =============================================================================
// Queries
// =============================================================================

/// @brief Map an error to its category
[[nodiscard]] constexpr ErrorCategory categoryOf(AnalysisError error) noexcept {
    switch (error) {
        case AnalysisError::None:
            return ErrorCategory::None;
        case AnalysisError::InvalidRiffHeader:
        case AnalysisError::InvalidWaveFormat:
        case AnalysisError::MissingFormatChunk:
        case AnalysisError::MissingDataChunk:
        case AnalysisError::InvalidFormatFields:
        case AnalysisError::EmptyDataChunk:
            return ErrorCategory::Format;
        case AnalysisError::UnsupportedBitDepth:
        case AnalysisError::UnsupportedAudioFormat:
            return ErrorCategory::UnsupportedFormat;
        case AnalysisError::EmptyInput:
        case AnalysisError::InvalidFFTSize:
        case AnalysisError::InvalidOverlap:
        case AnalysisError::InvalidSampleRate:
        case AnalysisError::InvalidFrameIndex:
            return ErrorCategory::InvalidInput;
    }
    return ErrorCategory::InvalidInput;
}

/// @brief Short human-readable description of an error
[[nodiscard]] constexpr std::string_view describe(AnalysisError error) noexcept {
    switch (error) {
        case AnalysisError::None:                   return "No error";
        case AnalysisError::InvalidRiffHeader:      return "Invalid WAV file: no RIFF header";
        case AnalysisError::InvalidWaveFormat:      return "Invalid WAV file: no WAVE format";
        case AnalysisError::MissingFormatChunk:     return "Invalid WAV file: no \"fmt \" chunk";
        case AnalysisError::MissingDataChunk:       return "Invalid WAV file: no \"data\" chunk";
        case AnalysisError::InvalidFormatFields:    return "Invalid WAV file: zero channels or sample rate";
        case AnalysisError::EmptyDataChunk:         return "Invalid WAV file: data chunk is empty";
        case AnalysisError::UnsupportedBitDepth:    return "Unsupported WAV bit depth";
        case AnalysisError::UnsupportedAudioFormat: return "Unsupported 32-bit WAV format type";
        case AnalysisError::EmptyInput:             return "Invalid empty input data";
        case AnalysisError::InvalidFFTSize:         return "FFT size must be a power of two in [32, 1048576]";
        case AnalysisError::InvalidOverlap:         return "Overlap must be in [0, 1) and leave a hop of at least one sample";
        case AnalysisError::InvalidSampleRate:      return "Sample rate must be positive";
        case AnalysisError::InvalidFrameIndex:      return "Frame index is outside the spectrogram";
    }
    return "Unknown error";
}

/// @brief Category name for diagnostics ("FormatError", ...)
[[nodiscard]] constexpr std::string_view categoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:              return "None";
        case ErrorCategory::Format:            return "FormatError";
        case ErrorCategory::UnsupportedFormat: return "UnsupportedFormatError";
        case ErrorCategory::InvalidInput:      return "InvalidInputError";
    }
    return "InvalidInputError";
}

} // namespace DSP
} // namespace Sono
