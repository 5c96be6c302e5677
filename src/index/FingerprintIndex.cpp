#include "FingerprintIndex.h"
#include <stdexcept>

namespace Earmark {

void FingerprintIndex::ingest(const std::string& trackId, const std::vector<HashEntry>& entries) {
    if (entries.empty()) {
        return;
    }
    if (entries.size() >= static_cast<size_t>(NONE) - records.size()) {
        throw std::length_error("fingerprint index is full");
    }

    // Stage: every allocation happens before the first record is linked.
    // Chains created here stay empty until linking and are invisible to lookup.
    records.reserve(records.size() + entries.size());
    for (const HashEntry& entry : entries) {
        chains.try_emplace(entry.hash);
    }

    TrackOrdinal track;
    auto known = trackOrdinals.find(trackId);
    if (known != trackOrdinals.end()) {
        track = known->second;
    } else {
        track = static_cast<TrackOrdinal>(trackIds.size());
        trackIds.push_back(trackId);
        try {
            trackOrdinals.emplace(trackId, track);
        } catch (...) {
            trackIds.pop_back();
            throw;
        }
    }

    // Commit: no allocation below
    for (const HashEntry& entry : entries) {
        appendRecord(entry.hash, entry.anchorTime, track);
    }
}

void FingerprintIndex::appendRecord(const Hash& hash, double anchorTime, TrackOrdinal track) {
    const uint32_t idx = static_cast<uint32_t>(records.size());
    records.push_back(Record{hash, anchorTime, track, NONE});

    Chain& chain = chains.find(hash)->second;
    if (chain.count == 0) {
        chain.head = idx;
        distinctHashes++;
    } else {
        records[chain.tail].next = idx;
    }
    chain.tail = idx;
    chain.count++;
}

std::vector<Occurrence> FingerprintIndex::lookup(const Hash& hash) const {
    std::vector<Occurrence> result;
    result.reserve(occurrenceCount(hash));
    forEachOccurrence(hash, [&](TrackOrdinal track, double anchorTime) {
        result.emplace_back(trackIds[track], anchorTime);
    });
    return result;
}

size_t FingerprintIndex::occurrenceCount(const Hash& hash) const {
    auto it = chains.find(hash);
    return it == chains.end() ? 0 : it->second.count;
}

bool FingerprintIndex::containsTrack(const std::string& trackId) const {
    return trackOrdinals.find(trackId) != trackOrdinals.end();
}

void FingerprintIndex::merge(const FingerprintIndex& other) {
    if (&other == this) {
        throw std::invalid_argument("cannot merge a fingerprint index into itself");
    }
    other.forEachTrackEntries([this](const std::string& trackId, const std::vector<HashEntry>& entries) {
        ingest(trackId, entries);
    });
}

void FingerprintIndex::clear() {
    records.clear();
    chains.clear();
    trackIds.clear();
    trackOrdinals.clear();
    distinctHashes = 0;
}

} // namespace Earmark
