#include "Types.h"
#include "../core/Errors.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace Earmark {

namespace {

void checkStrictlyIncreasing(const std::vector<double>& axis, const char* name) {
    for (size_t i = 0; i < axis.size(); i++) {
        if (std::isnan(axis[i])) {
            throw InvalidSpectrogram(std::string(name) + " axis contains NaN at index " + std::to_string(i));
        }
        if (i > 0 && !(axis[i] > axis[i - 1])) {
            throw InvalidSpectrogram(std::string(name) + " axis is not strictly increasing at index " + std::to_string(i));
        }
    }
}

} // namespace

void Spectrogram::validate() const {
    if (amplitudes.size() != frequencies.size()) {
        throw InvalidSpectrogram("amplitude rows (" + std::to_string(amplitudes.size()) +
                                 ") != frequency bins (" + std::to_string(frequencies.size()) + ")");
    }
    for (size_t i = 0; i < amplitudes.size(); i++) {
        if (amplitudes[i].size() != times.size()) {
            throw InvalidSpectrogram("amplitude row " + std::to_string(i) + " has " +
                                     std::to_string(amplitudes[i].size()) + " columns, expected " +
                                     std::to_string(times.size()));
        }
        for (double value : amplitudes[i]) {
            if (std::isnan(value)) {
                throw InvalidSpectrogram("amplitude row " + std::to_string(i) + " contains NaN");
            }
        }
    }
    checkStrictlyIncreasing(times, "time");
    checkStrictlyIncreasing(frequencies, "frequency");
}

uint64_t Hash::packed() const {
    // 24 bits per frequency, 16 bits for delta time
    uint64_t f1 = static_cast<uint64_t>(static_cast<uint32_t>(anchorFrequency)) & 0xFFFFFF;
    uint64_t f2 = static_cast<uint64_t>(static_cast<uint32_t>(targetFrequency)) & 0xFFFFFF;
    uint64_t dt = static_cast<uint64_t>(static_cast<uint32_t>(deltaTimeMs)) & 0xFFFF;
    return (f1 << 40) | (f2 << 16) | dt;
}

bool Hash::operator<(const Hash& other) const {
    return std::tie(anchorFrequency, targetFrequency, deltaTimeMs) <
           std::tie(other.anchorFrequency, other.targetFrequency, other.deltaTimeMs);
}

std::string Hash::toString() const {
    std::ostringstream oss;
    oss << "(" << anchorFrequency << " Hz, " << targetFrequency << " Hz, " << deltaTimeMs << " ms)";
    return oss.str();
}

std::string HashEntry::toString() const {
    std::ostringstream oss;
    oss << "Hash: " << hash.toString() << ", Anchor: " << std::fixed << std::setprecision(3)
        << anchorTime << " s";
    if (!trackId.empty()) {
        oss << ", Track: " << trackId;
    }
    return oss.str();
}

std::string MatchResult::toString() const {
    std::ostringstream oss;
    oss << trackId << " (Score: " << score << ", Matches: " << totalCandidateHashes
        << ", Offset: " << std::fixed << std::setprecision(2) << offsetSeconds << " s)";
    return oss.str();
}

} // namespace Earmark
