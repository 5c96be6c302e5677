#include "Storage.h"
#include "../index/FingerprintIndex.h"
#include "../recognition/Recognizer.h"
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

namespace Earmark {

namespace {

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // namespace

bool IndexStore::forEachStoredTrack(const TrackRunFn& fn) {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return false;
    }

    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT anchor_freq, target_freq, delta_ms, anchor_time, track_id "
        "FROM fingerprint ORDER BY rowid";

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to prepare load query: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    std::string currentTrack;
    std::vector<HashEntry> run;

    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Hash hash(sqlite3_column_int(stmt, 0), sqlite3_column_int(stmt, 1), sqlite3_column_int(stmt, 2));
            double anchorTime = sqlite3_column_double(stmt, 3);
            std::string trackId = columnText(stmt, 4);

            if (!run.empty() && trackId != currentTrack) {
                fn(currentTrack, run);
                run.clear();
            }
            currentTrack = trackId;
            run.emplace_back(hash, anchorTime, trackId);
        }
    } catch (...) {
        sqlite3_finalize(stmt);
        throw;
    }

    bool ok = (rc == SQLITE_DONE);
    if (!ok) {
        std::cerr << "Failed while reading fingerprints: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);

    if (ok && !run.empty()) {
        fn(currentTrack, run);
    }
    return ok;
}

IndexStore::IndexStore(const std::string& dbPath) : dbPath(dbPath), db(nullptr), isOpen(false) {}

IndexStore::~IndexStore() {
    close();
}

bool IndexStore::open() {
    if (isOpen) {
        return true;
    }

    int rc = sqlite3_open(dbPath.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open database: " << sqlite3_errmsg(db) << std::endl;
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db, 30000);
    isOpen = true;

    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL",
        "PRAGMA synchronous=NORMAL",
        "PRAGMA temp_store=MEMORY"
    };
    for (const char* pragma : pragmas) {
        if (!executeSQL(pragma)) {
            std::cerr << "  Warning: continuing without " << pragma << std::endl;
        }
    }

    return setupTables();
}

bool IndexStore::close() {
    bool closed = true;
    if (isOpen && db) {
        if (sqlite3_exec(db, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "Warning: final checkpoint failed: " << sqlite3_errmsg(db) << std::endl;
        }
        if (sqlite3_close(db) != SQLITE_OK) {
            std::cerr << "Warning: database closed with statements still open: " << sqlite3_errmsg(db) << std::endl;
            closed = false;
            sqlite3_close_v2(db);
        }
        db = nullptr;
        isOpen = false;
    }
    return closed;
}

bool IndexStore::executeSQL(const std::string& sql) {
    if (!isOpen || !db) {
        std::cerr << "Database not open" << std::endl;
        return false;
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (errMsg ? errMsg : "unknown") << " (Code: " << rc << ")" << std::endl;
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool IndexStore::setupTables() {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return false;
    }

    std::string createFingerprintTable =
        "CREATE TABLE IF NOT EXISTS fingerprint ("
        "anchor_freq INTEGER, "
        "target_freq INTEGER, "
        "delta_ms INTEGER, "
        "anchor_time REAL, "
        "track_id TEXT"
        ")";

    std::string createTrackTable =
        "CREATE TABLE IF NOT EXISTS track_info ("
        "track_id TEXT PRIMARY KEY, "
        "title TEXT, "
        "artist TEXT, "
        "album TEXT, "
        "duration REAL"
        ")";

    std::string createIndex =
        "CREATE INDEX IF NOT EXISTS idx_fingerprint_hash "
        "ON fingerprint (anchor_freq, target_freq, delta_ms)";

    return executeSQL(createFingerprintTable) &&
           executeSQL(createTrackTable) &&
           executeSQL(createIndex);
}

bool IndexStore::checkpointDb() {
    return executeSQL("PRAGMA wal_checkpoint(FULL)");
}

bool IndexStore::trackInDb(const std::string& trackId) {
    if (!isOpen) {
        return false;
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT COUNT(*) FROM track_info WHERE track_id = ?";

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_text(stmt, 1, trackId.c_str(), -1, SQLITE_TRANSIENT);

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count > 0;
}

bool IndexStore::insertTrack(const std::string& trackId, const std::vector<HashEntry>& entries,
                             const TrackInfo& info) {
    sqlite3_stmt* infoStmt;
    const char* infoSql =
        "INSERT OR REPLACE INTO track_info (track_id, title, artist, album, duration) VALUES (?, ?, ?, ?, ?)";

    int rc = sqlite3_prepare_v2(db, infoSql, -1, &infoStmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to prepare track info statement: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    const std::string title = info.title.empty() ? "Unknown" : info.title;
    const std::string artist = info.artist.empty() ? "Unknown" : info.artist;
    const std::string album = info.album.empty() ? "Unknown" : info.album;

    sqlite3_bind_text(infoStmt, 1, trackId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(infoStmt, 2, title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(infoStmt, 3, artist.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(infoStmt, 4, album.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(infoStmt, 5, info.duration);

    rc = sqlite3_step(infoStmt);
    sqlite3_finalize(infoStmt);

    if (rc != SQLITE_DONE) {
        std::cerr << "Failed to insert track info: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_stmt* hashStmt;
    const char* hashSql =
        "INSERT INTO fingerprint (anchor_freq, target_freq, delta_ms, anchor_time, track_id) "
        "VALUES (?, ?, ?, ?, ?)";

    rc = sqlite3_prepare_v2(db, hashSql, -1, &hashStmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to prepare fingerprint statement: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    bool success = true;
    for (size_t i = 0; i < entries.size(); i++) {
        const HashEntry& entry = entries[i];

        sqlite3_bind_int(hashStmt, 1, entry.hash.anchorFrequency);
        sqlite3_bind_int(hashStmt, 2, entry.hash.targetFrequency);
        sqlite3_bind_int(hashStmt, 3, entry.hash.deltaTimeMs);
        sqlite3_bind_double(hashStmt, 4, entry.anchorTime);
        sqlite3_bind_text(hashStmt, 5, trackId.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(hashStmt);
        if (rc != SQLITE_DONE) {
            std::cerr << "Failed to insert fingerprint: " << sqlite3_errmsg(db) << " (Code: " << rc << ")" << std::endl;
            success = false;
            break;
        }

        sqlite3_reset(hashStmt);

        if ((i + 1) % 5000 == 0) {
            std::cout << "  Inserted " << (i + 1) << "/" << entries.size() << " hashes..." << std::endl;
        }
    }

    sqlite3_finalize(hashStmt);
    return success;
}

bool IndexStore::storeTrack(const std::string& trackId, const std::vector<HashEntry>& entries,
                            const TrackInfo& info) {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return false;
    }

    // Retry on lock contention from other writers
    const int maxRetries = 3;
    for (int attempt = 0; attempt < maxRetries; attempt++) {
        if (attempt > 0) {
            std::cout << "  Retrying database operation (attempt " << (attempt + 1) << ")" << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * attempt));
        }

        if (!executeSQL("BEGIN IMMEDIATE TRANSACTION")) {
            continue;
        }

        if (insertTrack(trackId, entries, info) && executeSQL("COMMIT")) {
            std::cout << "  Stored " << entries.size() << " hashes for " << trackId << std::endl;
            return true;
        }

        if (!executeSQL("ROLLBACK")) {
            std::cerr << "  Rollback failed for " << trackId << std::endl;
        }
    }

    std::cerr << "Failed to store track after " << maxRetries << " attempts" << std::endl;
    return false;
}

TrackInfo IndexStore::getTrackInfo(const std::string& trackId) {
    TrackInfo info;

    if (!isOpen || trackId.empty()) {
        return info;
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT title, artist, album, duration FROM track_info WHERE track_id = ?";

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to prepare track info query: " << sqlite3_errmsg(db) << std::endl;
        return info;
    }

    sqlite3_bind_text(stmt, 1, trackId.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        info.trackId = trackId;
        info.title = columnText(stmt, 0);
        info.artist = columnText(stmt, 1);
        info.album = columnText(stmt, 2);
        info.duration = sqlite3_column_double(stmt, 3);
    }

    sqlite3_finalize(stmt);
    return info;
}

bool IndexStore::saveIndex(const FingerprintIndex& index) {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return false;
    }

    bool success = true;
    index.forEachTrackEntries([&](const std::string& trackId, const std::vector<HashEntry>& entries) {
        if (!success) {
            return;
        }
        TrackInfo info = getTrackInfo(trackId);
        if (info.trackId.empty()) {
            info.trackId = trackId;
        }
        success = storeTrack(trackId, entries, info);
    });
    return success;
}

size_t IndexStore::loadInto(Recognizer& recognizer) {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return 0;
    }

    size_t tracks = 0;
    bool complete = forEachStoredTrack([&](const std::string& trackId, const std::vector<HashEntry>& entries) {
        recognizer.ingestHashes(trackId, entries);
        tracks++;
    });
    if (!complete) {
        std::cerr << "Fingerprint load incomplete after " << tracks << " tracks" << std::endl;
    }
    return tracks;
}

size_t IndexStore::loadInto(FingerprintIndex& index) {
    if (!isOpen) {
        std::cerr << "Database not open" << std::endl;
        return 0;
    }

    size_t tracks = 0;
    bool complete = forEachStoredTrack([&](const std::string& trackId, const std::vector<HashEntry>& entries) {
        index.ingest(trackId, entries);
        tracks++;
    });
    if (!complete) {
        std::cerr << "Fingerprint load incomplete after " << tracks << " tracks" << std::endl;
    }
    return tracks;
}

int IndexStore::countRows(const char* sql) {
    if (!isOpen) return 0;

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return 0;

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

int IndexStore::getTotalTracks() {
    return countRows("SELECT COUNT(*) FROM track_info");
}

int IndexStore::getTotalHashes() {
    return countRows("SELECT COUNT(*) FROM fingerprint");
}

} // namespace Earmark
