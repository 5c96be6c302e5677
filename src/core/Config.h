#ifndef EARMARK_CONFIG_H
#define EARMARK_CONFIG_H

#include "Constants.h"
#include <nlohmann/json.hpp>
#include <string>

namespace Earmark {

// STFT resolution: larger frames sharpen frequency, larger hops coarsen time
struct SpectrogramParams {
    int frameSize = FRAME_SIZE;
    int hopSize = HOP_SIZE;
    double topDb = TOP_DB;
    // Divide dB values by the loudest cell, so thresholds become fractions of
    // the peak level (e.g. 0.8) instead of absolute dB
    bool normalize = false;

    void validate() const;
};

// Peak sparsity
struct PeakParams {
    double amplitudeThreshold = AMPLITUDE_THRESHOLD;
    int windowSize = PEAK_WINDOW_SIZE;

    void validate() const;
};

// Rectangle, relative to an anchor, in which partner landmarks are sought.
// Wider zones give more distinctive pairs at the cost of recall on short clips.
struct TargetZone {
    double offsetTime = TARGET_OFFSET_TIME;
    double offsetFreq = TARGET_OFFSET_FREQ;
    double deltaTime = TARGET_DELTA_TIME;
    double deltaFreq = TARGET_DELTA_FREQ;
    int fanOut = TARGET_FAN_OUT;

    TargetZone() = default;
    TargetZone(double offsetTime, double offsetFreq, double deltaTime, double deltaFreq, int fanOut)
        : offsetTime(offsetTime), offsetFreq(offsetFreq),
          deltaTime(deltaTime), deltaFreq(deltaFreq), fanOut(fanOut) {}

    void validate() const;
};

// Offset-histogram tolerance and result trimming
struct MatchConfig {
    double bucketWidth = OFFSET_BUCKET_WIDTH;
    int minScore = MIN_MATCH_SCORE;
    int maxResults = MAX_MATCH_RESULTS;

    void validate() const;
};

struct FingerprintConfig {
    int sampleRate = SAMPLE_RATE;
    SpectrogramParams spectrogram;
    PeakParams peaks;
    TargetZone targetZone;
    MatchConfig match;

    void validate() const;
};

// Keys mirror the struct groups; absent keys keep their defaults
FingerprintConfig configFromJson(const nlohmann::json& doc);
FingerprintConfig loadConfigFile(const std::string& path);
nlohmann::json configToJson(const FingerprintConfig& config);

// Reads an environment variable, falling back when unset or empty
std::string getEnvOr(const char* name, const std::string& fallback);

bool isPowerOfTwo(int value);

} // namespace Earmark

#endif
