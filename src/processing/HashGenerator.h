#ifndef EARMARK_HASH_GENERATOR_H
#define EARMARK_HASH_GENERATOR_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include <string>
#include <vector>

namespace Earmark {

// Quantizes an anchor/target pair to the integer Hz / ms grid
Hash hashPointPair(const Landmark& anchor, const Landmark& target);

// Landmarks strictly inside the anchor's target rectangle, in constellation
// order, capped at zone.fanOut.
//
// Both functions require a constellation sorted by ascending time, as
// extractPeaks produces, and throw std::invalid_argument otherwise.
std::vector<Landmark> getTargetZone(const Landmark& anchor, const ConstellationMap& constellation,
                                    const TargetZone& zone);

// One entry per (anchor, selected target); at most fanOut entries per anchor.
// Entries are ordered by anchor, then by target, following the constellation.
std::vector<HashEntry> generateHashes(const ConstellationMap& constellation, const TargetZone& zone,
                                      const std::string& trackId = "");

} // namespace Earmark

#endif
