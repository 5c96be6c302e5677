#ifndef EARMARK_TRACK_LIBRARY_H
#define EARMARK_TRACK_LIBRARY_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include "../recognition/Recognizer.h"
#include "../storage/Storage.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Earmark {

struct RankedMatch {
    MatchResult result;
    TrackInfo info;

    RankedMatch(const MatchResult& result, const TrackInfo& info) : result(result), info(info) {}
};

// File-level driver: decodes audio, tags metadata, persists to SQLite and
// keeps the in-memory Recognizer in sync with the store.
class TrackLibrary {
private:
    FingerprintConfig config;
    std::unique_ptr<Recognizer> recognizer;
    std::unique_ptr<IndexStore> store;
    std::mutex storeMutex;

    TrackInfo extractMetadata(const std::string& filename, const std::string& trackId);
    bool commitTrack(const std::string& filename, const std::string& trackId,
                     const std::vector<HashEntry>& hashes, double duration);

public:
    TrackLibrary(const std::string& dbPath, const FingerprintConfig& config = FingerprintConfig(),
                 std::unique_ptr<SpectrogramProvider> provider = nullptr);
    ~TrackLibrary();

    // Opens the store and loads every stored track into memory
    bool initialize();

    // Track registration
    bool registerFile(const std::string& filename);
    bool registerDirectory(const std::string& path, int numWorkers = 4);

    // Track recognition
    std::vector<RankedMatch> recognizeFile(const std::string& filename);
    std::vector<RankedMatch> recognizeSamples(const std::vector<double>& samples, int sampleRate);

    void printTopMatches(const std::vector<RankedMatch>& matches) const;
    void printDatabaseStats();
    int getTotalTracks();
    int getTotalHashes();

    Recognizer& engine() { return *recognizer; }
    const FingerprintConfig& configuration() const { return config; }

    // Utility functions
    static std::string trackIdForPath(const std::string& filename);
    static std::vector<std::string> getSupportedFiles(const std::string& directory);
};

} // namespace Earmark

#endif
