#include "Recognizer.h"
#include "Matcher.h"
#include "../processing/PeakDetection.h"
#include "../processing/HashGenerator.h"
#include "../core/Errors.h"
#include <algorithm>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

namespace Earmark {

std::vector<HashEntry> fingerprintSamples(SpectrogramProvider& provider, const FingerprintConfig& config,
                                          const std::vector<double>& samples, int sampleRate,
                                          const std::string& trackId) {
    Spectrogram spec = provider.compute(samples, sampleRate);
    ConstellationMap peaks = extractPeaks(spec, config.peaks);
    return generateHashes(peaks, config.targetZone, trackId);
}

Recognizer::Recognizer(const FingerprintConfig& config, std::unique_ptr<SpectrogramProvider> provider)
    : config(config), provider(std::move(provider)) {
    this->config.validate();
    if (!this->provider) {
        this->provider = std::make_unique<FftwSpectrogramProvider>(this->config.spectrogram);
    }
}

ConstellationMap Recognizer::constellation(const std::vector<double>& samples, int sampleRate) {
    std::lock_guard<std::mutex> lock(providerMutex);
    Spectrogram spec = provider->compute(samples, sampleRate);
    std::cout << "  Spectrogram: " << spec.numFrequencies() << " x " << spec.numTimes() << std::endl;
    return extractPeaks(spec, config.peaks);
}

std::vector<HashEntry> Recognizer::fingerprint(const std::vector<double>& samples, int sampleRate,
                                               const std::string& trackId) {
    ConstellationMap peaks = constellation(samples, sampleRate);
    std::cout << "  Found peaks: " << peaks.size() << std::endl;

    std::vector<HashEntry> hashes = generateHashes(peaks, config.targetZone, trackId);
    std::cout << "  Generated hashes: " << hashes.size() << std::endl;
    return hashes;
}

void Recognizer::ingestTrack(const std::string& trackId, const std::vector<double>& samples, int sampleRate) {
    std::vector<HashEntry> hashes = fingerprint(samples, sampleRate, trackId);
    ingestHashes(trackId, hashes);
}

void Recognizer::ingestHashes(const std::string& trackId, const std::vector<HashEntry>& entries) {
    std::unique_lock<std::shared_mutex> lock(indexMutex);
    fingerprintIndex.ingest(trackId, entries);
}

std::vector<std::vector<HashEntry>> Recognizer::fingerprintBatch(const std::vector<TrackAudio>& tracks,
                                                                 int numWorkers,
                                                                 const CancellationToken* cancel) {
    std::vector<std::vector<HashEntry>> fingerprints(tracks.size());
    if (tracks.empty()) {
        return fingerprints;
    }

    size_t workers = numWorkers > 0 ? static_cast<size_t>(numWorkers)
                                    : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, tracks.size());

    std::cout << "Fingerprinting " << tracks.size() << " tracks with " << workers << " workers" << std::endl;

    using Fingerprinted = std::pair<size_t, std::vector<HashEntry>>;
    std::vector<std::future<std::vector<Fingerprinted>>> futures;
    const size_t perWorker = tracks.size() / workers;
    const size_t remainder = tracks.size() % workers;

    size_t startIdx = 0;
    for (size_t w = 0; w < workers; w++) {
        const size_t endIdx = startIdx + perWorker + (w < remainder ? 1 : 0);
        std::shared_ptr<SpectrogramProvider> workerProvider;
        {
            std::lock_guard<std::mutex> lock(providerMutex);
            workerProvider = provider->clone();
        }

        futures.push_back(std::async(std::launch::async,
            [this, &tracks, startIdx, endIdx, workerProvider, cancel]() {
                std::vector<Fingerprinted> results;
                results.reserve(endIdx - startIdx);
                for (size_t i = startIdx; i < endIdx; i++) {
                    if (isCancelled(cancel)) {
                        break;
                    }
                    const TrackAudio& track = tracks[i];
                    results.emplace_back(i, fingerprintSamples(*workerProvider, config, track.samples,
                                                               track.sampleRate, track.trackId));
                }
                return results;
            }));

        startIdx = endIdx;
    }

    size_t finished = 0;
    for (auto& future : futures) {
        for (auto& result : future.get()) {
            fingerprints[result.first] = std::move(result.second);
            finished++;
        }
    }

    if (finished < tracks.size()) {
        throw OperationCancelled("fingerprinting stopped after " + std::to_string(finished) + " of " +
                                 std::to_string(tracks.size()) + " tracks");
    }
    return fingerprints;
}

size_t Recognizer::ingestBatch(const std::vector<TrackAudio>& tracks, int numWorkers,
                               const CancellationToken* cancel) {
    std::vector<std::vector<HashEntry>> fingerprints = fingerprintBatch(tracks, numWorkers, cancel);

    size_t committed = 0;
    for (size_t i = 0; i < tracks.size(); i++) {
        if (isCancelled(cancel)) {
            throw OperationCancelled("batch ingestion stopped after " + std::to_string(committed) + " of " +
                                     std::to_string(tracks.size()) + " tracks");
        }
        ingestHashes(tracks[i].trackId, fingerprints[i]);
        std::cout << "  Ingested " << tracks[i].trackId << " (" << fingerprints[i].size() << " hashes)" << std::endl;
        committed++;
    }
    return committed;
}

std::vector<MatchResult> Recognizer::recognize(const std::vector<double>& samples, int sampleRate,
                                               const CancellationToken* cancel) {
    return recognize(samples, sampleRate, config.peaks, config.targetZone, config.match, cancel);
}

std::vector<MatchResult> Recognizer::recognize(const std::vector<double>& samples, int sampleRate,
                                               const PeakParams& peaks, const TargetZone& zone,
                                               const MatchConfig& match, const CancellationToken* cancel) {
    peaks.validate();
    zone.validate();
    match.validate();

    Spectrogram spec;
    {
        std::lock_guard<std::mutex> lock(providerMutex);
        spec = provider->compute(samples, sampleRate);
    }
    std::cout << "  Spectrogram: " << spec.numFrequencies() << " x " << spec.numTimes() << std::endl;

    ConstellationMap landmarks = extractPeaks(spec, peaks);
    std::cout << "  Found peaks: " << landmarks.size() << std::endl;

    std::vector<HashEntry> hashes = generateHashes(landmarks, zone);
    std::cout << "  Generated hashes: " << hashes.size() << std::endl;

    std::shared_lock<std::shared_mutex> lock(indexMutex);
    Matcher matcher(fingerprintIndex, match);
    return matcher.match(hashes, cancel);
}

std::vector<MatchResult> Recognizer::recognizeHashes(const std::vector<HashEntry>& entries,
                                                     const CancellationToken* cancel) const {
    std::shared_lock<std::shared_mutex> lock(indexMutex);
    Matcher matcher(fingerprintIndex, config.match);
    return matcher.match(entries, cancel);
}

bool Recognizer::hasTrack(const std::string& trackId) const {
    std::shared_lock<std::shared_mutex> lock(indexMutex);
    return fingerprintIndex.containsTrack(trackId);
}

IndexStats Recognizer::stats() const {
    std::shared_lock<std::shared_mutex> lock(indexMutex);
    IndexStats result;
    result.tracks = fingerprintIndex.trackCount();
    result.distinctHashes = fingerprintIndex.hashCount();
    result.occurrences = fingerprintIndex.occurrenceCount();
    return result;
}

} // namespace Earmark
