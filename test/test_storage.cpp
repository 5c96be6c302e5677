#include <catch2/catch.hpp>

#include "storage/Storage.h"
#include "index/FingerprintIndex.h"
#include "recognition/Recognizer.h"
#include "FakeSpectrogramProvider.h"

#include <stdexcept>

using namespace Earmark;

namespace {

std::vector<HashEntry> sampleEntries(const std::string& trackId) {
    return {
        HashEntry(Hash(1000, 1500, 2000), 1.0, trackId),
        HashEntry(Hash(1000, 1750, 2500), 1.0, trackId),
        HashEntry(Hash(1500, 1250, 500), 3.0, trackId)
    };
}

} // namespace

TEST_CASE("Stored tracks keep their metadata", "[storage]") {
    IndexStore store(":memory:");
    REQUIRE(store.open());

    REQUIRE(store.storeTrack("A", sampleEntries("A"), TrackInfo("A", "Title", "Artist", "", 12.5)));

    CHECK(store.trackInDb("A"));
    CHECK_FALSE(store.trackInDb("B"));
    CHECK(store.getTotalTracks() == 1);
    CHECK(store.getTotalHashes() == 3);

    TrackInfo info = store.getTrackInfo("A");
    CHECK(info.trackId == "A");
    CHECK(info.title == "Title");
    CHECK(info.artist == "Artist");
    CHECK(info.album == "Unknown");
    CHECK(info.duration == Approx(12.5));

    CHECK(store.getTrackInfo("missing").trackId.empty());
}

TEST_CASE("Loading replays stored tracks in insertion order", "[storage]") {
    IndexStore store(":memory:");
    REQUIRE(store.open());
    REQUIRE(store.storeTrack("A", sampleEntries("A"), TrackInfo("A", "a", "x", "y")));
    REQUIRE(store.storeTrack("B", sampleEntries("B"), TrackInfo("B", "b", "x", "y")));

    FingerprintIndex index;
    CHECK(store.loadInto(index) == 2);

    std::vector<Occurrence> hits = index.lookup(Hash(1000, 1500, 2000));
    REQUIRE(hits.size() == 2);
    CHECK(hits[0] == Occurrence("A", 1.0));
    CHECK(hits[1] == Occurrence("B", 1.0));
    CHECK(index.occurrenceCount() == 6);
}

TEST_CASE("An in-memory index survives a save and reload", "[storage]") {
    FingerprintIndex original;
    original.ingest("A", sampleEntries("A"));
    original.ingest("B", {HashEntry(Hash(10, 20, 30), 4.0)});

    IndexStore store(":memory:");
    REQUIRE(store.open());
    REQUIRE(store.saveIndex(original));
    CHECK(store.getTotalTracks() == 2);

    Recognizer engine(EarmarkTest::fakeConfig(), std::make_unique<EarmarkTest::FakeSpectrogramProvider>());
    CHECK(store.loadInto(engine) == 2);

    IndexStats stats = engine.stats();
    CHECK(stats.tracks == 2);
    CHECK(stats.occurrences == original.occurrenceCount());
    CHECK(stats.distinctHashes == original.hashCount());
}

TEST_CASE("A closed store refuses work", "[storage]") {
    IndexStore store(":memory:");

    CHECK_FALSE(store.storeTrack("A", sampleEntries("A"), TrackInfo()));
    CHECK(store.getTotalTracks() == 0);

    FingerprintIndex index;
    CHECK(store.loadInto(index) == 0);
}

TEST_CASE("A throwing load callback releases the read statement", "[storage]") {
    IndexStore store(":memory:");
    REQUIRE(store.open());
    REQUIRE(store.storeTrack("A", sampleEntries("A"), TrackInfo("A", "a", "x", "y")));
    REQUIRE(store.storeTrack("B", sampleEntries("B"), TrackInfo("B", "b", "x", "y")));

    int calls = 0;
    CHECK_THROWS_AS(store.forEachStoredTrack([&](const std::string&, const std::vector<HashEntry>&) {
        ++calls;
        throw std::runtime_error("ingest failed");
    }), std::runtime_error);
    CHECK(calls == 1);

    // The store is still usable and closes without an outstanding statement
    std::vector<std::string> seen;
    CHECK(store.forEachStoredTrack([&](const std::string& trackId, const std::vector<HashEntry>& entries) {
        seen.push_back(trackId);
        CHECK(entries.size() == 3);
    }));
    CHECK(seen == std::vector<std::string>{"A", "B"});
    CHECK(store.close());
}
