#include "Matcher.h"
#include "../core/Errors.h"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace Earmark {

long offsetBucket(double offsetSeconds, double bucketWidth) {
    return std::lround(offsetSeconds / bucketWidth);
}

OffsetPeak dominantBucket(const OffsetHistogram& histogram) {
    OffsetPeak peak;
    for (const auto& bucket : histogram) {
        if (bucket.second > peak.count) {
            peak = OffsetPeak(bucket.first, bucket.second);
        }
    }
    return peak;
}

Matcher::Matcher(const FingerprintIndex& index, const MatchConfig& config)
    : index(index), matchConfig(config) {
    matchConfig.validate();
}

namespace {

struct Candidate {
    OffsetHistogram histogram;
    int total = 0;
};

} // namespace

std::vector<MatchResult> Matcher::match(const std::vector<HashEntry>& query,
                                        const CancellationToken* cancel) const {
    std::unordered_map<FingerprintIndex::TrackOrdinal, Candidate> candidates;
    const double width = matchConfig.bucketWidth;

    for (const HashEntry& entry : query) {
        if (isCancelled(cancel)) {
            throw OperationCancelled("match aborted after partial scan");
        }
        const double queryTime = entry.anchorTime;
        index.forEachOccurrence(entry.hash, [&](FingerprintIndex::TrackOrdinal track, double dbTime) {
            Candidate& candidate = candidates[track];
            candidate.histogram[offsetBucket(dbTime - queryTime, width)]++;
            candidate.total++;
        });
    }

    std::vector<MatchResult> results;
    results.reserve(candidates.size());
    for (const auto& item : candidates) {
        OffsetPeak peak = dominantBucket(item.second.histogram);
        if (peak.count < matchConfig.minScore) {
            continue;
        }
        results.emplace_back(index.trackName(item.first),
                             static_cast<double>(peak.bucket) * width,
                             peak.count,
                             item.second.total);
    }

    std::sort(results.begin(), results.end(),
              [](const MatchResult& a, const MatchResult& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  if (a.totalCandidateHashes != b.totalCandidateHashes) {
                      return a.totalCandidateHashes > b.totalCandidateHashes;
                  }
                  return a.trackId < b.trackId;
              });

    if (matchConfig.maxResults > 0 && results.size() > static_cast<size_t>(matchConfig.maxResults)) {
        results.resize(matchConfig.maxResults);
    }

    return results;
}

} // namespace Earmark
