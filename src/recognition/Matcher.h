#ifndef EARMARK_MATCHER_H
#define EARMARK_MATCHER_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include "../core/Cancellation.h"
#include "../index/FingerprintIndex.h"
#include <map>
#include <vector>

namespace Earmark {

// Offset histogram for one candidate track: bucket index -> votes
using OffsetHistogram = std::map<long, int>;

struct OffsetPeak {
    long bucket;
    int count;

    OffsetPeak() : bucket(0), count(0) {}
    OffsetPeak(long bucket, int count) : bucket(bucket), count(count) {}
};

long offsetBucket(double offsetSeconds, double bucketWidth);

// Highest bucket; among equal counts the lowest bucket index wins
OffsetPeak dominantBucket(const OffsetHistogram& histogram);

// Scores candidate tracks by time-offset consensus. A true match piles its
// votes into one bucket (every pair shifts by the same offset); chance hash
// collisions scatter across buckets.
class Matcher {
private:
    const FingerprintIndex& index;
    MatchConfig matchConfig;

public:
    // Validates config; the index must outlive the matcher
    Matcher(const FingerprintIndex& index, const MatchConfig& config = MatchConfig());

    // Ranked best first: score desc, total candidate hashes desc, track id asc.
    // Empty when no query hash hits the index. Throws OperationCancelled when
    // the token fires between query entries.
    std::vector<MatchResult> match(const std::vector<HashEntry>& query,
                                   const CancellationToken* cancel = nullptr) const;

    const MatchConfig& config() const { return matchConfig; }
};

} // namespace Earmark

#endif
