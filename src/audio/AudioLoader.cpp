#include "AudioLoader.h"
#include "../core/Errors.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

#define DR_WAV_IMPLEMENTATION
#define DR_MP3_IMPLEMENTATION
#define DR_FLAC_IMPLEMENTATION
#include <dr_wav.h>
#include <dr_mp3.h>
#include <dr_flac.h>

namespace Earmark {

namespace {

std::string lowercaseExtension(const std::string& filename) {
    std::string extension = std::filesystem::path(filename).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

// Shared tail of every decoder: copy, downmix, resample
AudioBuffer finishDecode(const float* pSampleData, unsigned long long totalPCMFrameCount,
                         unsigned int channels, unsigned int sampleRate, int targetSampleRate) {
    size_t totalSamples = static_cast<size_t>(totalPCMFrameCount) * channels;
    std::vector<double> audioData(pSampleData, pSampleData + totalSamples);

    if (channels > 1) {
        std::cout << "  Downmixing " << channels << " channels to mono" << std::endl;
        audioData = downmixToMono(audioData, channels);
    }

    int rate = static_cast<int>(sampleRate);
    if (targetSampleRate > 0 && rate != targetSampleRate) {
        std::cout << "  Resampling from " << rate << " Hz to " << targetSampleRate << " Hz" << std::endl;
        audioData = resample(audioData, rate, targetSampleRate);
        rate = targetSampleRate;
    }

    return AudioBuffer(std::move(audioData), rate);
}

} // namespace

AudioBuffer loadWavFile(const std::string& filename, int targetSampleRate) {
    unsigned int channels;
    unsigned int sampleRate;
    drwav_uint64 totalPCMFrameCount;

    float* pSampleData = drwav_open_file_and_read_pcm_frames_f32(
        filename.c_str(), &channels, &sampleRate, &totalPCMFrameCount, nullptr);

    if (pSampleData == nullptr) {
        throw AudioLoadError("Failed to load WAV file: " + filename);
    }

    std::cout << "  WAV info: " << channels << " channels, "
              << sampleRate << " Hz, " << totalPCMFrameCount << " frames" << std::endl;

    try {
        AudioBuffer buffer = finishDecode(pSampleData, totalPCMFrameCount, channels, sampleRate, targetSampleRate);
        drwav_free(pSampleData, nullptr);
        return buffer;
    } catch (...) {
        drwav_free(pSampleData, nullptr);
        throw;
    }
}

AudioBuffer loadMp3File(const std::string& filename, int targetSampleRate) {
    drmp3_config config;
    drmp3_uint64 totalPCMFrameCount;

    float* pSampleData = drmp3_open_file_and_read_pcm_frames_f32(
        filename.c_str(), &config, &totalPCMFrameCount, nullptr);

    if (pSampleData == nullptr) {
        throw AudioLoadError("Failed to load MP3 file: " + filename);
    }

    std::cout << "  MP3 info: " << config.channels << " channels, "
              << config.sampleRate << " Hz, " << totalPCMFrameCount << " frames" << std::endl;

    try {
        AudioBuffer buffer = finishDecode(pSampleData, totalPCMFrameCount, config.channels,
                                          config.sampleRate, targetSampleRate);
        drmp3_free(pSampleData, nullptr);
        return buffer;
    } catch (...) {
        drmp3_free(pSampleData, nullptr);
        throw;
    }
}

AudioBuffer loadFlacFile(const std::string& filename, int targetSampleRate) {
    unsigned int channels;
    unsigned int sampleRate;
    drflac_uint64 totalPCMFrameCount;

    float* pSampleData = drflac_open_file_and_read_pcm_frames_f32(
        filename.c_str(), &channels, &sampleRate, &totalPCMFrameCount, nullptr);

    if (pSampleData == nullptr) {
        throw AudioLoadError("Failed to load FLAC file: " + filename);
    }

    std::cout << "  FLAC info: " << channels << " channels, "
              << sampleRate << " Hz, " << totalPCMFrameCount << " frames" << std::endl;

    try {
        AudioBuffer buffer = finishDecode(pSampleData, totalPCMFrameCount, channels, sampleRate, targetSampleRate);
        drflac_free(pSampleData, nullptr);
        return buffer;
    } catch (...) {
        drflac_free(pSampleData, nullptr);
        throw;
    }
}

AudioBuffer loadAudioFile(const std::string& filename, int targetSampleRate) {
    if (targetSampleRate < 0) {
        throw InvalidConfiguration("target sample rate must not be negative");
    }

    const std::string extension = lowercaseExtension(filename);
    try {
        if (extension == ".wav") {
            return loadWavFile(filename, targetSampleRate);
        } else if (extension == ".mp3") {
            return loadMp3File(filename, targetSampleRate);
        } else if (extension == ".flac") {
            return loadFlacFile(filename, targetSampleRate);
        }
    } catch (const AudioLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw AudioLoadError("Error loading " + filename + ": " + e.what());
    }
    throw AudioLoadError("Unsupported audio format: " + extension);
}

bool isSupportedFormat(const std::string& filename) {
    const std::string extension = lowercaseExtension(filename);
    return extension == ".wav" || extension == ".mp3" || extension == ".flac";
}

std::vector<double> resample(const std::vector<double>& input, int originalSampleRate, int targetSampleRate) {
    if (originalSampleRate == targetSampleRate || input.empty()) {
        return input;
    }
    if (originalSampleRate <= 0 || targetSampleRate <= 0) {
        throw InvalidConfiguration("sample rates must be positive for resampling");
    }

    double ratio = static_cast<double>(originalSampleRate) / targetSampleRate;
    size_t outputSize = static_cast<size_t>(input.size() / ratio);
    std::vector<double> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; i++) {
        double sourceIndex = static_cast<double>(i) * ratio;
        size_t index = static_cast<size_t>(sourceIndex);

        if (index < input.size() - 1) {
            double fraction = sourceIndex - static_cast<double>(index);
            output.push_back(input[index] * (1.0 - fraction) + input[index + 1] * fraction);
        } else if (index < input.size()) {
            output.push_back(input[index]);
        }
    }

    return output;
}

std::vector<double> downmixToMono(const std::vector<double>& interleaved, unsigned int channels) {
    if (channels <= 1) {
        return interleaved;
    }

    std::vector<double> monoData;
    monoData.reserve(interleaved.size() / channels);

    for (size_t i = 0; i + channels <= interleaved.size(); i += channels) {
        double sum = 0.0;
        for (unsigned int c = 0; c < channels; c++) {
            sum += interleaved[i + c];
        }
        monoData.push_back(sum / channels);
    }

    return monoData;
}

} // namespace Earmark
