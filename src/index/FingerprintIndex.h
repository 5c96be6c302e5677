#ifndef EARMARK_FINGERPRINT_INDEX_H
#define EARMARK_FINGERPRINT_INDEX_H

#include "../utils/Types.h"
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace Earmark {

// Append-only inverted index: hash -> (track, anchor time) occurrences.
//
// Occurrences live in a single arena in insertion order. Each distinct hash
// keeps the head, tail and length of a chain threaded through the arena, so
// lookups walk one key's postings without nested containers and duplicate
// evidence from the same track is kept.
//
// Not synchronized: ingest/merge must be serialized by the owner. Concurrent
// const access is safe once no writer is active.
class FingerprintIndex {
public:
    using TrackOrdinal = uint32_t;

    FingerprintIndex() = default;

    // Appends every entry under trackId. All-or-nothing: if staging fails
    // nothing from this call becomes visible. Empty input is a no-op.
    void ingest(const std::string& trackId, const std::vector<HashEntry>& entries);

    // Occurrences in insertion order; empty when the hash was never ingested
    std::vector<Occurrence> lookup(const Hash& hash) const;

    // Zero-copy walk over one key's postings: fn(TrackOrdinal, double anchorTime)
    template <typename Fn>
    void forEachOccurrence(const Hash& hash, Fn&& fn) const {
        auto it = chains.find(hash);
        if (it == chains.end()) {
            return;
        }
        for (uint32_t idx = it->second.head; idx != NONE; idx = records[idx].next) {
            fn(records[idx].track, records[idx].anchorTime);
        }
    }

    // Walks contiguous runs of one track's records, in arena order:
    // fn(const std::string& trackId, const std::vector<HashEntry>& entries)
    template <typename Fn>
    void forEachTrackEntries(Fn&& fn) const {
        size_t i = 0;
        while (i < records.size()) {
            const TrackOrdinal track = records[i].track;
            std::vector<HashEntry> run;
            while (i < records.size() && records[i].track == track) {
                run.emplace_back(records[i].hash, records[i].anchorTime, trackIds[track]);
                i++;
            }
            fn(trackIds[track], run);
        }
    }

    // Appends another shard's occurrences after this index's, one ingest per
    // contiguous track run of the shard
    void merge(const FingerprintIndex& other);

    const std::string& trackName(TrackOrdinal ordinal) const { return trackIds.at(ordinal); }
    bool containsTrack(const std::string& trackId) const;
    size_t occurrenceCount(const Hash& hash) const;

    size_t trackCount() const { return trackIds.size(); }
    size_t hashCount() const { return distinctHashes; }
    size_t occurrenceCount() const { return records.size(); }
    bool empty() const { return records.empty(); }

    void clear();

private:
    static constexpr uint32_t NONE = std::numeric_limits<uint32_t>::max();

    struct Record {
        Hash hash;
        double anchorTime;
        TrackOrdinal track;
        uint32_t next;
    };

    struct Chain {
        uint32_t head = NONE;
        uint32_t tail = NONE;
        uint32_t count = 0;
    };

    std::vector<Record> records;
    std::unordered_map<Hash, Chain> chains;
    std::vector<std::string> trackIds;
    std::unordered_map<std::string, TrackOrdinal> trackOrdinals;
    size_t distinctHashes = 0;

    void appendRecord(const Hash& hash, double anchorTime, TrackOrdinal track);
};

} // namespace Earmark

#endif
