#ifndef EARMARK_RECOGNIZER_H
#define EARMARK_RECOGNIZER_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include "../core/Cancellation.h"
#include "../audio/SpectrogramProvider.h"
#include "../index/FingerprintIndex.h"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace Earmark {

struct TrackAudio {
    std::string trackId;
    std::vector<double> samples;
    int sampleRate;

    TrackAudio(const std::string& trackId, std::vector<double> samples, int sampleRate)
        : trackId(trackId), samples(std::move(samples)), sampleRate(sampleRate) {}
};

struct IndexStats {
    size_t tracks = 0;
    size_t distinctHashes = 0;
    size_t occurrences = 0;
};

// Spectrogram -> peaks -> hashes pipeline with one shared configuration
std::vector<HashEntry> fingerprintSamples(SpectrogramProvider& provider, const FingerprintConfig& config,
                                          const std::vector<double>& samples, int sampleRate,
                                          const std::string& trackId = "");

// Owns the in-memory index. Ingestion takes an exclusive lock, one track at a
// time; queries take a shared lock and may run concurrently.
class Recognizer {
private:
    FingerprintConfig config;
    std::unique_ptr<SpectrogramProvider> provider;
    std::mutex providerMutex;
    FingerprintIndex fingerprintIndex;
    mutable std::shared_mutex indexMutex;

public:
    // Validates the whole configuration up front. Without a provider an
    // FftwSpectrogramProvider is built from config.spectrogram.
    explicit Recognizer(const FingerprintConfig& config = FingerprintConfig(),
                        std::unique_ptr<SpectrogramProvider> provider = nullptr);

    ConstellationMap constellation(const std::vector<double>& samples, int sampleRate);
    std::vector<HashEntry> fingerprint(const std::vector<double>& samples, int sampleRate,
                                       const std::string& trackId = "");

    void ingestTrack(const std::string& trackId, const std::vector<double>& samples, int sampleRate);
    void ingestHashes(const std::string& trackId, const std::vector<HashEntry>& entries);

    // Parallel fingerprinting, one cloned provider per worker (numWorkers <= 0
    // picks hardware concurrency). Results follow input order. Throws
    // OperationCancelled if the token fires before every track is done.
    std::vector<std::vector<HashEntry>> fingerprintBatch(const std::vector<TrackAudio>& tracks,
                                                         int numWorkers = 0,
                                                         const CancellationToken* cancel = nullptr);

    // fingerprintBatch, then serial commits in input order. Cancellation is
    // honoured between tracks: tracks committed before it stay, none is
    // half-ingested.
    size_t ingestBatch(const std::vector<TrackAudio>& tracks, int numWorkers = 0,
                       const CancellationToken* cancel = nullptr);

    std::vector<MatchResult> recognize(const std::vector<double>& samples, int sampleRate,
                                       const CancellationToken* cancel = nullptr);
    // Query-time tuning, independent of the values the index was built with.
    // All three are validated before any audio is processed.
    std::vector<MatchResult> recognize(const std::vector<double>& samples, int sampleRate,
                                       const PeakParams& peaks, const TargetZone& zone,
                                       const MatchConfig& match,
                                       const CancellationToken* cancel = nullptr);
    std::vector<MatchResult> recognizeHashes(const std::vector<HashEntry>& entries,
                                             const CancellationToken* cancel = nullptr) const;

    bool hasTrack(const std::string& trackId) const;
    IndexStats stats() const;
    const FingerprintConfig& configuration() const { return config; }

    // Read access under the shared lock, e.g. for persistence
    template <typename Fn>
    void withIndex(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(indexMutex);
        fn(fingerprintIndex);
    }
};

} // namespace Earmark

#endif
