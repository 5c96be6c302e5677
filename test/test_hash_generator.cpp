#include <catch2/catch.hpp>

#include "processing/HashGenerator.h"
#include "core/Errors.h"

#include <algorithm>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>
#include <utility>

using namespace Earmark;

TEST_CASE("Two landmarks produce exactly one hash", "[hashes]") {
    ConstellationMap constellation = {Landmark(1.0, 1000.0), Landmark(3.0, 1500.0)};
    TargetZone zone(0.5, 0.0, 5.0, 1000.0, 10);

    std::vector<HashEntry> hashes = generateHashes(constellation, zone);

    REQUIRE(hashes.size() == 1);
    CHECK(hashes[0].hash == Hash(1000, 1500, 2000));
    CHECK(hashes[0].anchorTime == 1.0);
    CHECK(hashes[0].trackId.empty());
}

TEST_CASE("Track id is stamped on every entry", "[hashes]") {
    ConstellationMap constellation = {Landmark(1.0, 1000.0), Landmark(3.0, 1500.0)};
    TargetZone zone(0.5, 0.0, 5.0, 1000.0, 10);

    std::vector<HashEntry> hashes = generateHashes(constellation, zone, "track-7");

    REQUIRE(hashes.size() == 1);
    CHECK(hashes[0].trackId == "track-7");
}

TEST_CASE("Target zone bounds are exclusive on every side", "[hashes]") {
    const Landmark anchor(0.0, 1000.0);
    ConstellationMap constellation = {
        anchor,
        Landmark(1.0, 2000.0),   // time == tMin
        Landmark(5.0, 1500.0),   // frequency == fMin
        Landmark(5.0, 2000.0),
        Landmark(5.0, 2500.0),   // frequency == fMax
        Landmark(11.0, 2000.0)   // time == tMax
    };
    TargetZone zone(1.0, 500.0, 10.0, 1000.0, 10);

    std::vector<Landmark> targets = getTargetZone(anchor, constellation, zone);

    REQUIRE(targets.size() == 1);
    CHECK(targets[0].time == 5.0);
    CHECK(targets[0].frequency == 2000.0);
}

TEST_CASE("Fan-out caps pairs per anchor in constellation order", "[hashes]") {
    ConstellationMap constellation = {Landmark(0.0, 1000.0)};
    for (int k = 0; k < 20; k++) {
        constellation.emplace_back(2.0 + 0.25 * k, 2000.0);
    }
    TargetZone zone(1.0, 500.0, 10.0, 1000.0, 5);

    std::vector<Landmark> targets = getTargetZone(constellation[0], constellation, zone);
    REQUIRE(targets.size() == 5);
    for (int k = 0; k < 5; k++) {
        CHECK(targets[k].time == 2.0 + 0.25 * k);
    }

    std::vector<HashEntry> hashes = generateHashes(constellation, zone);
    size_t fromFirstAnchor = 0;
    for (const auto& entry : hashes) {
        if (entry.anchorTime == 0.0) fromFirstAnchor++;
    }
    CHECK(fromFirstAnchor == 5);
    // Targets at 2000 Hz pair with nothing: their own zone starts at 2500 Hz
    CHECK(hashes.size() == 5);
}

TEST_CASE("Zero fan-out and empty constellations yield no hashes", "[hashes]") {
    ConstellationMap constellation = {Landmark(1.0, 1000.0), Landmark(3.0, 1500.0)};

    CHECK(generateHashes(constellation, TargetZone(0.5, 0.0, 5.0, 1000.0, 0)).empty());
    CHECK(generateHashes(ConstellationMap(), TargetZone()).empty());
}

TEST_CASE("A zone reaching back over the anchor pairs it with itself", "[hashes]") {
    ConstellationMap constellation = {Landmark(2.0, 800.0)};
    TargetZone zone(-1.0, -100.0, 2.0, 200.0, 10);

    std::vector<HashEntry> hashes = generateHashes(constellation, zone);

    REQUIRE(hashes.size() == 1);
    CHECK(hashes[0].hash == Hash(800, 800, 0));
}

TEST_CASE("Hash fields round to whole Hz and milliseconds", "[hashes]") {
    Hash hash = hashPointPair(Landmark(1.0, 1000.4), Landmark(1.0123, 1500.6));

    CHECK(hash.anchorFrequency == 1000);
    CHECK(hash.targetFrequency == 1501);
    CHECK(hash.deltaTimeMs == 12);
}

TEST_CASE("Hashes from a cropped recording are found in the full recording", "[hashes]") {
    // Times on a 0.25 s grid keep the shifted arithmetic exact
    ConstellationMap full;
    const double freqs[] = {600.0, 1400.0, 900.0, 2100.0, 1700.0, 1100.0, 2500.0, 800.0};
    for (int k = 0; k < 32; k++) {
        full.emplace_back(0.25 * k, freqs[k % 8] + 10.0 * (k % 3));
    }
    TargetZone zone(0.2, -1500.0, 3.0, 3000.0, 4);

    const double cropStart = 2.0;
    ConstellationMap cropped;
    for (const auto& lm : full) {
        if (lm.time >= cropStart) cropped.emplace_back(lm.time - cropStart, lm.frequency);
    }

    std::set<std::pair<Hash, double>> reference;
    for (const auto& entry : generateHashes(full, zone)) {
        reference.insert({entry.hash, entry.anchorTime});
    }

    std::vector<HashEntry> croppedHashes = generateHashes(cropped, zone);
    REQUIRE_FALSE(croppedHashes.empty());
    for (const auto& entry : croppedHashes) {
        CHECK(reference.count({entry.hash, entry.anchorTime + cropStart}) == 1);
    }
}

TEST_CASE("Malformed target zones are rejected", "[hashes]") {
    ConstellationMap constellation = {Landmark(1.0, 1000.0)};

    CHECK_THROWS_AS(generateHashes(constellation, TargetZone(1.0, 0.0, 0.0, 1000.0, 5)), InvalidConfiguration);
    CHECK_THROWS_AS(generateHashes(constellation, TargetZone(1.0, 0.0, 5.0, -1.0, 5)), InvalidConfiguration);
    CHECK_THROWS_AS(generateHashes(constellation, TargetZone(1.0, 0.0, 5.0, 1000.0, -1)), InvalidConfiguration);
    CHECK_THROWS_AS(generateHashes(constellation,
                                   TargetZone(std::numeric_limits<double>::quiet_NaN(), 0.0, 5.0, 1000.0, 5)),
                    InvalidConfiguration);
}

TEST_CASE("Hash generation is deterministic", "[hashes]") {
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> time(0.0, 30.0);
    std::uniform_real_distribution<double> freq(100.0, 5000.0);

    ConstellationMap constellation(400);
    for (auto& lm : constellation) lm = Landmark(time(rng), freq(rng));
    std::sort(constellation.begin(), constellation.end(), [](const Landmark& a, const Landmark& b) {
        return a.time != b.time ? a.time < b.time : a.frequency < b.frequency;
    });

    std::vector<HashEntry> first = generateHashes(constellation, TargetZone(), "T");
    std::vector<HashEntry> second = generateHashes(constellation, TargetZone(), "T");

    REQUIRE_FALSE(first.empty());
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); i++) {
        CHECK(first[i].hash.anchorFrequency == second[i].hash.anchorFrequency);
        CHECK(first[i].hash.targetFrequency == second[i].hash.targetFrequency);
        CHECK(first[i].hash.deltaTimeMs == second[i].hash.deltaTimeMs);
        CHECK(first[i].anchorTime == second[i].anchorTime);
        CHECK(first[i].trackId == second[i].trackId);
    }
}

TEST_CASE("Unsorted constellations are rejected", "[hashes]") {
    ConstellationMap constellation = {Landmark(3.0, 1500.0), Landmark(1.0, 1000.0)};
    TargetZone zone(0.5, 0.0, 5.0, 1000.0, 10);

    CHECK_THROWS_AS(generateHashes(constellation, zone), std::invalid_argument);
    CHECK_THROWS_AS(getTargetZone(constellation[1], constellation, zone), std::invalid_argument);
}
