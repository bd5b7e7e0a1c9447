// ==============================================================================
// sono_analyze - Command-line WAV Spectrum Analyzer
// ==============================================================================
// Decodes a WAV file, optionally filters it, and writes:
//   <prefix>_spectrogram.csv   full dB matrix (one row per frame)
//   <prefix>_spectrogram.ppm   color-mapped display grid
//   <prefix>_spectrum.csv      full-recording spectrum plot points
//   <prefix>_slice.csv         time-slice spectrum (with --slice)
//
// Usage:
//   sono_analyze input.wav [--fft-size N] [--overlap R] [--window NAME]
//                [--min-freq HZ] [--max-freq HZ] [--dynamic-range DB]
//                [--color-map NAME] [--filter PRESET | --coeffs FILE]
//                [--slice FRAME] [--out PREFIX]
//
// Coefficient files hold two lines, "b: b0 b1 ..." and "a: a0 a1 ...".
// ==============================================================================

#include <sono/dsp/core/analysis_error.h>
#include <sono/dsp/core/axis_ticks.h>
#include <sono/dsp/core/color_map.h>
#include <sono/dsp/core/window_functions.h>
#include <sono/dsp/io/wav_reader.h>
#include <sono/dsp/primitives/filter_presets.h>
#include <sono/dsp/primitives/iir_filter.h>
#include <sono/dsp/systems/spectrogram_display.h>
#include <sono/dsp/systems/spectrogram_generator.h>
#include <sono/dsp/systems/spectrum_snapshot.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace Sono::DSP;

namespace {

// ==============================================================================
// Command Line
// ==============================================================================

struct CommandLine {
    std::filesystem::path input;
    std::string outPrefix = "sono";
    SpectrogramOptions options;
    std::optional<FilterPreset> preset;
    std::filesystem::path coeffsFile;
    std::optional<size_t> slice;
};

void printUsage() {
    std::cerr << "Usage: sono_analyze input.wav [--fft-size N] [--overlap R] [--window NAME]\n"
                 "                    [--min-freq HZ] [--max-freq HZ] [--dynamic-range DB]\n"
                 "                    [--color-map NAME] [--filter PRESET | --coeffs FILE]\n"
                 "                    [--slice FRAME] [--out PREFIX]\n";
}

bool parseDouble(const char* text, double& value) {
    char* end = nullptr;
    value = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool parseSize(const char* text, size_t& value) {
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-') return false;
    value = static_cast<size_t>(parsed);
    return true;
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    if (argc < 2) return false;
    cmd.input = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string_view flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return false;
        }
        const char* value = argv[++i];

        bool ok = true;
        double number = 0.0;
        if (flag == "--fft-size") {
            ok = parseSize(value, cmd.options.fftSize);
        } else if (flag == "--overlap") {
            ok = parseDouble(value, cmd.options.overlap);
        } else if (flag == "--window") {
            cmd.options.windowType = parseWindowType(value);
        } else if (flag == "--min-freq") {
            ok = parseDouble(value, cmd.options.minFreq);
        } else if (flag == "--max-freq") {
            ok = parseDouble(value, cmd.options.maxFreq);
        } else if (flag == "--dynamic-range") {
            ok = parseDouble(value, number);
            cmd.options.dynamicRange = static_cast<float>(number);
        } else if (flag == "--color-map") {
            cmd.options.colorMap = parseColorMap(value);
        } else if (flag == "--filter") {
            cmd.preset = parseFilterPreset(value);
            ok = cmd.preset.has_value();
        } else if (flag == "--coeffs") {
            cmd.coeffsFile = value;
        } else if (flag == "--slice") {
            size_t frame = 0;
            ok = parseSize(value, frame);
            cmd.slice = frame;
        } else if (flag == "--out") {
            cmd.outPrefix = value;
        } else {
            std::cerr << "Unknown option: " << flag << "\n";
            return false;
        }

        if (!ok) {
            std::cerr << "Invalid value for " << flag << ": " << value << "\n";
            return false;
        }
    }
    return true;
}

// ==============================================================================
// File Helpers
// ==============================================================================

bool readFile(const std::filesystem::path& path, std::vector<uint8_t>& bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

/// Reads "b: ..." and "a: ..." lines; other lines are ignored
bool readCoefficients(const std::filesystem::path& path, IIRCoefficients& coeffs) {
    std::ifstream file(path);
    if (!file) return false;

    std::string line;
    while (std::getline(file, line)) {
        std::istringstream stream(line);
        std::string key;
        stream >> key;

        std::vector<double>* target = nullptr;
        if (key == "b:") target = &coeffs.b;
        else if (key == "a:") target = &coeffs.a;
        else continue;

        target->clear();
        double c = 0.0;
        while (stream >> c) target->push_back(c);
    }
    return !coeffs.b.empty();
}

bool writeSpectrogramCsv(const std::filesystem::path& path, const SpectrogramResult& result) {
    std::ofstream file(path);
    if (!file) return false;

    file << "time_s";
    for (const float f : result.frequencies) file << "," << f;
    file << "\n";

    for (size_t t = 0; t < result.numFrames(); ++t) {
        file << result.times[t];
        const float* row = result.frame(t);
        for (size_t k = 0; k < result.numBins(); ++k) file << "," << row[k];
        file << "\n";
    }
    return file.good();
}

/// Binary PPM, time left to right, frequency bottom to top
bool writeSpectrogramImage(const std::filesystem::path& path, const DisplayGrid& grid,
                           const SpectrogramOptions& options) {
    std::ofstream file(path, std::ios::binary);
    if (!file) return false;

    const size_t width = grid.numTimeCells();
    const size_t height = grid.numFreqCells();
    file << "P6\n" << width << " " << height << "\n255\n";

    for (size_t row = 0; row < height; ++row) {
        const size_t f = height - 1 - row;
        for (size_t t = 0; t < width; ++t) {
            const Rgb8 c = mapMagnitudeToColor(grid.at(t, f), options.dynamicRange,
                                               options.colorMap);
            const char pixel[3] = {static_cast<char>(c.r), static_cast<char>(c.g),
                                   static_cast<char>(c.b)};
            file.write(pixel, 3);
        }
    }
    return file.good();
}

bool writeSpectrumCsv(const std::filesystem::path& path,
                      const std::vector<SpectrumPlotPoint>& points) {
    std::ofstream file(path);
    if (!file) return false;
    file << "frequency_hz,magnitude\n";
    for (const auto& p : points) file << p.frequency << "," << p.magnitude << "\n";
    return file.good();
}

bool writeSliceCsv(const std::filesystem::path& path, const SpectrumSnapshot& snapshot) {
    std::ofstream file(path);
    if (!file) return false;
    file << "frequency_hz,magnitude\n";
    for (size_t k = 0; k < snapshot.spectrum.size(); ++k) {
        file << snapshot.frequencies[k] << "," << snapshot.spectrum[k] << "\n";
    }
    return file.good();
}

void printTicks(const char* label, const std::vector<double>& ticks) {
    std::cout << "  " << label << ":";
    for (const double t : ticks) std::cout << " " << t;
    std::cout << "\n";
}

int reportError(const char* stage, AnalysisError error, const std::string& detail = {}) {
    std::cerr << stage << " failed [" << categoryName(categoryOf(error)) << "]: "
              << (detail.empty() ? std::string(describe(error)) : detail) << "\n";
    return 1;
}

} // anonymous namespace

// ==============================================================================
// Main
// ==============================================================================

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage();
        return 2;
    }

    std::vector<uint8_t> bytes;
    if (!readFile(cmd.input, bytes)) {
        std::cerr << "Cannot read " << cmd.input << "\n";
        return 1;
    }

    WavReader reader;
    DecodedAudio audio;
    if (!reader.read(bytes, audio)) {
        return reportError("Decoding", reader.errorCode(), reader.lastError());
    }
    if (audio.truncated) {
        std::cerr << "Warning: data chunk is truncated, decoded "
                  << audio.numSamples << " samples per channel\n";
    }

    std::cout << "Input: " << cmd.input.string() << "\n"
              << "  " << audio.sampleRate << " Hz, " << audio.numChannels << " ch, "
              << audio.bitsPerSample << "-bit"
              << (audio.audioFormat == 3 ? " float" : "") << ", "
              << audio.duration << " s\n";

    // -------------------------------------------------------------------------
    // Filtering
    // -------------------------------------------------------------------------

    std::vector<float> samples = audio.mono.samples;

    std::optional<IIRCoefficients> coeffs;
    if (!cmd.coeffsFile.empty()) {
        IIRCoefficients fromFile;
        if (!readCoefficients(cmd.coeffsFile, fromFile)) {
            std::cerr << "Cannot read coefficients from " << cmd.coeffsFile << "\n";
            return 1;
        }
        coeffs = std::move(fromFile);
    } else if (cmd.preset) {
        coeffs = filterPreset(*cmd.preset);
    }

    if (coeffs) {
        CoefficientStatus status = CoefficientStatus::Ok;
        samples = applyIIRFilter(samples.data(), samples.size(), *coeffs, &status);
        if (status == CoefficientStatus::LeadingFeedbackNotUnity) {
            std::cerr << "Warning: a[0] is not 1, output is normalized by it\n";
        } else if (status == CoefficientStatus::LeadingFeedbackZero) {
            std::cerr << "Warning: a[0] is missing or zero, treated as 1\n";
        }
        std::cout << "Filter: " << coeffs->b.size() << " feedforward, "
                  << coeffs->a.size() << " feedback coefficients\n";
    }

    // -------------------------------------------------------------------------
    // Spectrogram
    // -------------------------------------------------------------------------

    SpectrogramOptions options = cmd.options;
    options.samplingRate = static_cast<double>(audio.sampleRate);
    options = options.resolved();

    SpectrogramGenerator generator;
    SpectrogramResult result;
    if (!generator.generate(samples.data(), samples.size(), options, result)) {
        return reportError("Spectrogram", generator.errorCode(), generator.lastError());
    }

    std::cout << "Spectrogram: " << result.numFrames() << " frames x " << result.numBins()
              << " bins (fft " << options.fftSize << ", hop " << options.hopSize() << ", "
              << windowTypeName(options.windowType) << ")\n";

    const std::filesystem::path prefix = cmd.outPrefix;
    const auto outPath = [&](const char* suffix) {
        return std::filesystem::path(prefix.string() + suffix);
    };

    if (!writeSpectrogramCsv(outPath("_spectrogram.csv"), result)) {
        std::cerr << "Failed to write " << outPath("_spectrogram.csv") << "\n";
        return 1;
    }

    const DisplayDecimation decimation = computeDisplayDecimation(
        result.numFrames(), result.numBins(), result.options.duration);
    const DisplayGrid grid = buildDisplayGrid(result, decimation, options.minFreq, options.maxFreq);
    if (!writeSpectrogramImage(outPath("_spectrogram.ppm"), grid, options)) {
        std::cerr << "Failed to write " << outPath("_spectrogram.ppm") << "\n";
        return 1;
    }
    std::cout << "  display grid " << grid.numTimeCells() << " x " << grid.numFreqCells()
              << " (step " << decimation.timeStep << ")\n";

    printTicks("time ticks (s)", timeTicks(result.options.duration));
    printTicks("frequency ticks (Hz)", frequencyTicks(options.maxFreq));

    // -------------------------------------------------------------------------
    // Full Recording Spectrum
    // -------------------------------------------------------------------------

    SpectrumSnapshot full;
    if (const AnalysisError error = analyzeFullRecording(samples.data(), samples.size(),
                                                         options, full);
        error != AnalysisError::None) {
        return reportError("Full spectrum", error);
    }
    if (!writeSpectrumCsv(outPath("_spectrum.csv"), full.plotPoints)) {
        std::cerr << "Failed to write " << outPath("_spectrum.csv") << "\n";
        return 1;
    }

    std::cout << "Full spectrum: fft " << full.fftSize << ", decimation "
              << full.decimationFactor << ", " << full.plotPoints.size() << " plot points\n";
    for (const auto& peak : findTopPeaks(full)) {
        std::cout << "  peak " << peak.frequency << " Hz, magnitude " << peak.magnitude << "\n";
    }

    // -------------------------------------------------------------------------
    // Time Slice
    // -------------------------------------------------------------------------

    if (cmd.slice) {
        SpectrumSnapshot slice;
        if (const AnalysisError error = analyzeTimeSlice(samples.data(), samples.size(), result,
                                                         *cmd.slice, slice);
            error != AnalysisError::None) {
            return reportError("Time slice", error);
        }
        if (!writeSliceCsv(outPath("_slice.csv"), slice)) {
            std::cerr << "Failed to write " << outPath("_slice.csv") << "\n";
            return 1;
        }
        std::cout << "Time slice " << *cmd.slice << " at " << result.times[*cmd.slice]
                  << " s: fft " << slice.fftSize << "\n";
    }

    std::cout << "Output prefix: " << std::filesystem::absolute(prefix).string() << "\n";
    return 0;
}
