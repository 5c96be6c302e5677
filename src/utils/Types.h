#ifndef EARMARK_TYPES_H
#define EARMARK_TYPES_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Earmark {

// Magnitude spectrogram in dB, amplitudes indexed [frequency][time]
struct Spectrogram {
    std::vector<double> times;
    std::vector<double> frequencies;
    std::vector<std::vector<double>> amplitudes;

    Spectrogram() = default;
    Spectrogram(const std::vector<double>& t,
                const std::vector<double>& f,
                const std::vector<std::vector<double>>& Sxx)
        : times(t), frequencies(f), amplitudes(Sxx) {}

    size_t numTimes() const { return times.size(); }
    size_t numFrequencies() const { return frequencies.size(); }
    bool empty() const { return times.empty() || frequencies.empty(); }

    // Throws InvalidSpectrogram on shape mismatch, NaN, or non-increasing axes
    void validate() const;
};

struct Landmark {
    double time;
    double frequency;
    int timeIdx;
    int freqIdx;
    double amplitude;

    Landmark() : time(0.0), frequency(0.0), timeIdx(0), freqIdx(0), amplitude(0.0) {}
    Landmark(double time, double frequency)
        : time(time), frequency(frequency), timeIdx(0), freqIdx(0), amplitude(0.0) {}
    Landmark(double time, double frequency, int timeIdx, int freqIdx, double amplitude)
        : time(time), frequency(frequency), timeIdx(timeIdx), freqIdx(freqIdx), amplitude(amplitude) {}
};

// Sorted by ascending time, then ascending frequency
using ConstellationMap = std::vector<Landmark>;

// Anchor/target pair key quantized to whole Hz and whole milliseconds
struct Hash {
    int32_t anchorFrequency;
    int32_t targetFrequency;
    int32_t deltaTimeMs;

    Hash() : anchorFrequency(0), targetFrequency(0), deltaTimeMs(0) {}
    Hash(int32_t anchorFrequency, int32_t targetFrequency, int32_t deltaTimeMs)
        : anchorFrequency(anchorFrequency), targetFrequency(targetFrequency), deltaTimeMs(deltaTimeMs) {}

    // Lossless 64-bit key for the non-negative ranges produced in practice
    uint64_t packed() const;
    std::string toString() const;

    bool operator==(const Hash& other) const {
        return anchorFrequency == other.anchorFrequency &&
               targetFrequency == other.targetFrequency &&
               deltaTimeMs == other.deltaTimeMs;
    }
    bool operator!=(const Hash& other) const { return !(*this == other); }
    bool operator<(const Hash& other) const;
};

struct HashEntry {
    Hash hash;
    double anchorTime;
    std::string trackId;  // empty for query recordings

    HashEntry() : anchorTime(0.0) {}
    HashEntry(const Hash& hash, double anchorTime, const std::string& trackId = "")
        : hash(hash), anchorTime(anchorTime), trackId(trackId) {}

    std::string toString() const;
};

struct Occurrence {
    std::string trackId;
    double anchorTime;

    Occurrence(const std::string& trackId, double anchorTime)
        : trackId(trackId), anchorTime(anchorTime) {}

    bool operator==(const Occurrence& other) const {
        return trackId == other.trackId && anchorTime == other.anchorTime;
    }
};

struct MatchResult {
    std::string trackId;
    double offsetSeconds;
    int score;
    int totalCandidateHashes;

    MatchResult() : offsetSeconds(0.0), score(0), totalCandidateHashes(0) {}
    MatchResult(const std::string& trackId, double offsetSeconds, int score, int totalCandidateHashes)
        : trackId(trackId), offsetSeconds(offsetSeconds), score(score), totalCandidateHashes(totalCandidateHashes) {}

    std::string toString() const;
};

} // namespace Earmark

namespace std {
template <>
struct hash<Earmark::Hash> {
    size_t operator()(const Earmark::Hash& h) const noexcept {
        // splitmix64 finalizer spreads the packed fields across buckets
        uint64_t x = h.packed();
        x ^= x >> 30;
        x *= 0xbf58476d1ce4e5b9ULL;
        x ^= x >> 27;
        x *= 0x94d049bb133111ebULL;
        x ^= x >> 31;
        return static_cast<size_t>(x);
    }
};
} // namespace std

#endif
