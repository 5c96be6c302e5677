#ifndef EARMARK_STORAGE_H
#define EARMARK_STORAGE_H

#include "../utils/Types.h"
#include <sqlite3.h>
#include <functional>
#include <string>
#include <vector>

namespace Earmark {

class Recognizer;
class FingerprintIndex;

struct TrackInfo {
    std::string trackId;
    std::string title;
    std::string artist;
    std::string album;
    double duration = 0.0;

    TrackInfo() = default;
    TrackInfo(const std::string& trackId, const std::string& title,
              const std::string& artist, const std::string& album, double duration = 0.0)
        : trackId(trackId), title(title), artist(artist), album(album), duration(duration) {}
};

// SQLite persistence for fingerprints and track metadata. Feeds the
// in-memory index only through Recognizer/FingerprintIndex ingest.
class IndexStore {
private:
    std::string dbPath;
    sqlite3* db;
    bool isOpen;

    bool executeSQL(const std::string& sql);
    bool insertTrack(const std::string& trackId, const std::vector<HashEntry>& entries, const TrackInfo& info);
    int countRows(const char* sql);

public:
    explicit IndexStore(const std::string& dbPath = "fingerprints.db");
    ~IndexStore();

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    // Database management
    bool open();
    // False when the handle could not be closed cleanly (a statement leaked)
    bool close();
    bool setupTables();
    bool checkpointDb();
    const std::string& path() const { return dbPath; }

    // Track operations; one transaction per track
    bool trackInDb(const std::string& trackId);
    bool storeTrack(const std::string& trackId, const std::vector<HashEntry>& entries, const TrackInfo& info);
    TrackInfo getTrackInfo(const std::string& trackId);

    // Writes every contiguous track run of an in-memory index
    bool saveIndex(const FingerprintIndex& index);

    using TrackRunFn = std::function<void(const std::string&, const std::vector<HashEntry>&)>;

    // Streams rows in rowid order and hands each contiguous track run to fn.
    // Exceptions from fn propagate after the statement is released.
    bool forEachStoredTrack(const TrackRunFn& fn);

    // Replays stored tracks in insertion order, one ingest per track.
    // Returns the number of tracks ingested.
    size_t loadInto(Recognizer& recognizer);
    size_t loadInto(FingerprintIndex& index);

    // Statistics
    int getTotalTracks();
    int getTotalHashes();
};

} // namespace Earmark

#endif
