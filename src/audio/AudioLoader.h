#ifndef EARMARK_AUDIO_LOADER_H
#define EARMARK_AUDIO_LOADER_H

#include "../core/Constants.h"
#include <string>
#include <utility>
#include <vector>

namespace Earmark {

struct AudioBuffer {
    std::vector<double> samples;  // mono
    int sampleRate;

    AudioBuffer() : sampleRate(0) {}
    AudioBuffer(std::vector<double> samples, int sampleRate)
        : samples(std::move(samples)), sampleRate(sampleRate) {}

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

// Decoders return mono audio at targetSampleRate (0 keeps the native rate).
// Throw AudioLoadError when the file cannot be decoded.
AudioBuffer loadWavFile(const std::string& filename, int targetSampleRate = SAMPLE_RATE);
AudioBuffer loadMp3File(const std::string& filename, int targetSampleRate = SAMPLE_RATE);
AudioBuffer loadFlacFile(const std::string& filename, int targetSampleRate = SAMPLE_RATE);
AudioBuffer loadAudioFile(const std::string& filename, int targetSampleRate = SAMPLE_RATE);
bool isSupportedFormat(const std::string& filename);

// Utility functions
std::vector<double> resample(const std::vector<double>& input, int originalSampleRate, int targetSampleRate);
std::vector<double> downmixToMono(const std::vector<double>& interleaved, unsigned int channels);

} // namespace Earmark

#endif
