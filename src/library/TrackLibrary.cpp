#include "TrackLibrary.h"
#include "../audio/AudioLoader.h"
#include "../core/Errors.h"
#include <algorithm>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <sstream>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>

namespace Earmark {

namespace {

std::string fileStem(const std::string& filename) {
    return std::filesystem::path(filename).stem().string();
}

struct LoadedFile {
    std::string filename;
    std::string trackId;
    AudioBuffer audio;
};

} // namespace

TrackLibrary::TrackLibrary(const std::string& dbPath, const FingerprintConfig& config,
                           std::unique_ptr<SpectrogramProvider> provider)
    : config(config) {
    recognizer = std::make_unique<Recognizer>(config, std::move(provider));
    store = std::make_unique<IndexStore>(dbPath);
}

TrackLibrary::~TrackLibrary() = default;

bool TrackLibrary::initialize() {
    std::lock_guard<std::mutex> lock(storeMutex);
    if (!store->open()) {
        return false;
    }

    size_t loaded = store->loadInto(*recognizer);
    IndexStats stats = recognizer->stats();
    std::cout << "Loaded " << loaded << " tracks (" << stats.occurrences << " hashes) from "
              << store->path() << std::endl;
    return true;
}

std::string TrackLibrary::trackIdForPath(const std::string& filename) {
    std::hash<std::string> hasher;
    size_t hashValue = hasher(filename);

    std::ostringstream oss;
    oss << std::hex << hashValue;
    return oss.str();
}

TrackInfo TrackLibrary::extractMetadata(const std::string& filename, const std::string& trackId) {
    TrackInfo info;
    info.trackId = trackId;

    TagLib::FileRef file(filename.c_str());

    if (!file.isNull() && file.tag()) {
        TagLib::Tag* tag = file.tag();

        info.title = tag->title().to8Bit(true);
        info.artist = tag->artist().to8Bit(true);
        info.album = tag->album().to8Bit(true);

        // Album artist beats track artist when present
        TagLib::PropertyMap properties = file.file()->properties();
        if (properties.contains("ALBUMARTIST") && !properties["ALBUMARTIST"].isEmpty()) {
            info.artist = properties["ALBUMARTIST"].front().to8Bit(true);
        } else if (properties.contains("ALBUM ARTIST") && !properties["ALBUM ARTIST"].isEmpty()) {
            info.artist = properties["ALBUM ARTIST"].front().to8Bit(true);
        }
    } else {
        std::cerr << "Warning: Could not read metadata from " << filename << std::endl;
    }

    if (info.title.empty()) {
        info.title = fileStem(filename);
    }
    if (info.artist.empty()) {
        info.artist = "Unknown Artist";
    }
    if (info.album.empty()) {
        info.album = "Unknown Album";
    }

    return info;
}

bool TrackLibrary::commitTrack(const std::string& filename, const std::string& trackId,
                               const std::vector<HashEntry>& hashes, double duration) {
    // Silent or featureless audio is not an error; there is just nothing to index
    if (hashes.empty()) {
        std::cout << "  Skipped " << filename << ": no fingerprints generated" << std::endl;
        return true;
    }

    TrackInfo info = extractMetadata(filename, trackId);
    info.duration = duration;

    {
        std::lock_guard<std::mutex> lock(storeMutex);
        if (!store->storeTrack(trackId, hashes, info)) {
            std::cerr << "Failed to store track in database: " << filename << std::endl;
            return false;
        }
    }

    // Stored first, so a failed store never leaves memory ahead of disk
    recognizer->ingestHashes(trackId, hashes);

    std::cout << "Successfully registered: " << filename << " (" << hashes.size() << " hashes)" << std::endl;
    std::cout << "  Title: " << info.title << std::endl;
    std::cout << "  Artist: " << info.artist << std::endl;
    std::cout << "  Album: " << info.album << std::endl;
    return true;
}

bool TrackLibrary::registerFile(const std::string& filename) {
    const std::string trackId = trackIdForPath(filename);

    {
        std::lock_guard<std::mutex> lock(storeMutex);
        if (store->trackInDb(trackId)) {
            std::cout << "Track already registered: " << filename << std::endl;
            return true;
        }
    }

    try {
        std::cout << "Registering: " << filename << std::endl;
        AudioBuffer audio = loadAudioFile(filename, config.sampleRate);
        std::vector<HashEntry> hashes = recognizer->fingerprint(audio.samples, audio.sampleRate, trackId);
        return commitTrack(filename, trackId, hashes, audio.durationSeconds());
    } catch (const std::exception& e) {
        std::cerr << "Error registering " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

bool TrackLibrary::registerDirectory(const std::string& path, int numWorkers) {
    std::vector<std::string> supportedFiles = getSupportedFiles(path);

    if (supportedFiles.empty()) {
        std::cout << "No supported audio files found in: " << path << std::endl;
        return false;
    }

    std::cout << "Found " << supportedFiles.size() << " supported files" << std::endl;

    if (numWorkers <= 1) {
        bool allSuccess = true;
        for (const std::string& file : supportedFiles) {
            if (!registerFile(file)) {
                allSuccess = false;
            }
        }
        return allSuccess;
    }

    // Decode and fingerprint a chunk in parallel, then commit it serially.
    // Chunking bounds how much decoded audio is held at once.
    bool allSuccess = true;
    const size_t chunkSize = static_cast<size_t>(numWorkers) * 2;

    for (size_t chunkStart = 0; chunkStart < supportedFiles.size(); chunkStart += chunkSize) {
        const size_t chunkEnd = std::min(chunkStart + chunkSize, supportedFiles.size());

        std::vector<std::future<LoadedFile>> loads;
        for (size_t i = chunkStart; i < chunkEnd; i++) {
            const std::string& file = supportedFiles[i];
            const std::string trackId = trackIdForPath(file);
            {
                std::lock_guard<std::mutex> lock(storeMutex);
                if (store->trackInDb(trackId)) {
                    std::cout << "Track already registered: " << file << std::endl;
                    continue;
                }
            }
            loads.push_back(std::async(std::launch::async, [this, file, trackId]() {
                return LoadedFile{file, trackId, loadAudioFile(file, config.sampleRate)};
            }));
        }

        std::vector<LoadedFile> loaded;
        for (auto& load : loads) {
            try {
                loaded.push_back(load.get());
            } catch (const std::exception& e) {
                std::cerr << "Error loading audio: " << e.what() << std::endl;
                allSuccess = false;
            }
        }
        if (loaded.empty()) {
            continue;
        }

        std::vector<TrackAudio> batch;
        batch.reserve(loaded.size());
        for (LoadedFile& file : loaded) {
            batch.emplace_back(file.trackId, std::move(file.audio.samples), file.audio.sampleRate);
        }

        std::vector<std::vector<HashEntry>> fingerprints;
        try {
            fingerprints = recognizer->fingerprintBatch(batch, numWorkers);
        } catch (const std::exception& e) {
            std::cerr << "Error fingerprinting batch: " << e.what() << std::endl;
            allSuccess = false;
            continue;
        }

        for (size_t i = 0; i < loaded.size(); i++) {
            const double duration = batch[i].sampleRate > 0
                ? static_cast<double>(batch[i].samples.size()) / batch[i].sampleRate : 0.0;
            if (!commitTrack(loaded[i].filename, loaded[i].trackId, fingerprints[i], duration)) {
                allSuccess = false;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(storeMutex);
        if (!store->checkpointDb()) {
            std::cerr << "Warning: WAL checkpoint failed" << std::endl;
        }
    }

    return allSuccess;
}

std::vector<RankedMatch> TrackLibrary::recognizeFile(const std::string& filename) {
    std::cout << "Recognizing: " << filename << std::endl;
    AudioBuffer audio = loadAudioFile(filename, config.sampleRate);
    return recognizeSamples(audio.samples, audio.sampleRate);
}

std::vector<RankedMatch> TrackLibrary::recognizeSamples(const std::vector<double>& samples, int sampleRate) {
    std::vector<MatchResult> results = recognizer->recognize(samples, sampleRate);

    std::vector<RankedMatch> ranked;
    ranked.reserve(results.size());

    std::lock_guard<std::mutex> lock(storeMutex);
    for (const MatchResult& result : results) {
        TrackInfo info = store->getTrackInfo(result.trackId);
        if (info.trackId.empty()) {
            info.trackId = result.trackId;
        }
        ranked.emplace_back(result, info);
    }
    return ranked;
}

void TrackLibrary::printTopMatches(const std::vector<RankedMatch>& matches) const {
    if (matches.empty()) {
        std::cout << "No matches found in database" << std::endl;
        return;
    }

    std::cout << "Top potential matches:" << std::endl;
    const size_t displayCount = std::min(matches.size(), static_cast<size_t>(TOP_MATCHES_DISPLAYED));

    for (size_t i = 0; i < displayCount; ++i) {
        const RankedMatch& match = matches[i];
        std::cout << "  " << (i + 1) << ". "
                  << match.info.artist << " - " << match.info.title
                  << " (Score: " << match.result.score
                  << ", Matches: " << match.result.totalCandidateHashes
                  << ", Offset: " << match.result.offsetSeconds << " s)" << std::endl;
    }
    std::cout << std::endl;
}

int TrackLibrary::getTotalTracks() {
    std::lock_guard<std::mutex> lock(storeMutex);
    return store->getTotalTracks();
}

int TrackLibrary::getTotalHashes() {
    std::lock_guard<std::mutex> lock(storeMutex);
    return store->getTotalHashes();
}

void TrackLibrary::printDatabaseStats() {
    int totalTracks = getTotalTracks();
    int totalHashes = getTotalHashes();
    IndexStats memory = recognizer->stats();

    std::cout << "\n=== Database Statistics ===" << std::endl;
    std::cout << "Total tracks: " << totalTracks << std::endl;
    std::cout << "Total hashes: " << totalHashes << std::endl;

    if (totalTracks > 0) {
        std::cout << "Average hashes per track: " << (totalHashes / totalTracks) << std::endl;
    }

    std::cout << "Distinct hash keys in memory: " << memory.distinctHashes << std::endl;
    std::cout << "==========================" << std::endl;
}

std::vector<std::string> TrackLibrary::getSupportedFiles(const std::string& directory) {
    std::vector<std::string> supportedFiles;

    try {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
            if (entry.is_regular_file() && isSupportedFormat(entry.path().string())) {
                supportedFiles.push_back(entry.path().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error accessing directory " << directory << ": " << e.what() << std::endl;
    }

    // Directory iteration order is unspecified; sort for reproducible ingestion
    std::sort(supportedFiles.begin(), supportedFiles.end());
    return supportedFiles;
}

} // namespace Earmark
