#include "HashGenerator.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <stdexcept>

namespace Earmark {

Hash hashPointPair(const Landmark& anchor, const Landmark& target) {
    return Hash(static_cast<int32_t>(std::lround(anchor.frequency)),
                static_cast<int32_t>(std::lround(target.frequency)),
                static_cast<int32_t>(std::lround((target.time - anchor.time) * 1000.0)));
}

namespace {

// Visits zone members in constellation order until fn returns false
template <typename Fn>
void scanTargetZone(const Landmark& anchor, const ConstellationMap& constellation,
                    const TargetZone& zone, Fn fn) {
    const double tMin = anchor.time + zone.offsetTime;
    const double tMax = tMin + zone.deltaTime;
    const double fMin = anchor.frequency + zone.offsetFreq;
    const double fMax = fMin + zone.deltaFreq;

    // First landmark with time > tMin; the bound is exclusive
    auto it = std::upper_bound(constellation.begin(), constellation.end(), tMin,
                               [](double t, const Landmark& lm) { return t < lm.time; });

    for (; it != constellation.end() && it->time < tMax; ++it) {
        if (it->frequency > fMin && it->frequency < fMax) {
            if (!fn(*it)) {
                return;
            }
        }
    }
}

void requireTimeSorted(const ConstellationMap& constellation) {
    auto unsorted = std::is_sorted_until(constellation.begin(), constellation.end(),
                                         [](const Landmark& a, const Landmark& b) { return a.time < b.time; });
    if (unsorted != constellation.end()) {
        throw std::invalid_argument("constellation is not sorted by time at index " +
                                    std::to_string(unsorted - constellation.begin()));
    }
}

} // namespace

std::vector<Landmark> getTargetZone(const Landmark& anchor, const ConstellationMap& constellation,
                                    const TargetZone& zone) {
    zone.validate();
    requireTimeSorted(constellation);

    std::vector<Landmark> targets;
    if (zone.fanOut == 0) {
        return targets;
    }
    targets.reserve(zone.fanOut);

    scanTargetZone(anchor, constellation, zone, [&](const Landmark& target) {
        targets.push_back(target);
        return static_cast<int>(targets.size()) < zone.fanOut;
    });
    return targets;
}

std::vector<HashEntry> generateHashes(const ConstellationMap& constellation, const TargetZone& zone,
                                      const std::string& trackId) {
    zone.validate();
    requireTimeSorted(constellation);

    std::vector<HashEntry> hashes;
    if (zone.fanOut == 0 || constellation.empty()) {
        return hashes;
    }
    hashes.reserve(constellation.size() * std::min<size_t>(zone.fanOut, 16));

    for (const Landmark& anchor : constellation) {
        int pairs = 0;
        scanTargetZone(anchor, constellation, zone, [&](const Landmark& target) {
            hashes.emplace_back(hashPointPair(anchor, target), anchor.time, trackId);
            return ++pairs < zone.fanOut;
        });
    }

    return hashes;
}

} // namespace Earmark
