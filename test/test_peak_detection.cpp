#include <catch2/catch.hpp>

#include "processing/PeakDetection.h"
#include "core/Errors.h"

#include <cmath>
#include <limits>
#include <random>
#include <set>
#include <utility>
#include <vector>

using namespace Earmark;

namespace {

// Grid of rows x cols zeros; times step 0.1 s, frequencies step 10 Hz
Spectrogram makeGrid(int rows, int cols, double fill = 0.0) {
    std::vector<double> times(cols);
    std::vector<double> freqs(rows);
    for (int j = 0; j < cols; j++) times[j] = j * 0.1;
    for (int i = 0; i < rows; i++) freqs[i] = i * 10.0;
    return Spectrogram(times, freqs, std::vector<std::vector<double>>(rows, std::vector<double>(cols, fill)));
}

std::set<std::pair<int, int>> positions(const ConstellationMap& peaks) {
    std::set<std::pair<int, int>> out;
    for (const auto& p : peaks) out.insert({p.freqIdx, p.timeIdx});
    return out;
}

} // namespace

TEST_CASE("Single strong cell becomes one landmark", "[peaks]") {
    Spectrogram spec = makeGrid(5, 5);
    spec.amplitudes[2][3] = 50.0;

    ConstellationMap peaks = extractPeaks(spec, 35.0);

    REQUIRE(peaks.size() == 1);
    CHECK(peaks[0].freqIdx == 2);
    CHECK(peaks[0].timeIdx == 3);
    CHECK(peaks[0].time == Approx(0.3));
    CHECK(peaks[0].frequency == Approx(20.0));
    CHECK(peaks[0].amplitude == 50.0);
}

TEST_CASE("Raising the threshold never adds landmarks", "[peaks]") {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(0.0, 80.0);

    Spectrogram spec = makeGrid(40, 60);
    for (auto& row : spec.amplitudes)
        for (double& v : row) v = dist(rng);

    auto low = positions(extractPeaks(spec, 20.0));
    auto mid = positions(extractPeaks(spec, 40.0));
    auto high = positions(extractPeaks(spec, 60.0));

    CHECK(low.size() >= mid.size());
    CHECK(mid.size() >= high.size());
    for (const auto& p : high) CHECK(mid.count(p) == 1);
    for (const auto& p : mid) CHECK(low.count(p) == 1);
}

TEST_CASE("Threshold above the loudest cell yields an empty map", "[peaks]") {
    Spectrogram spec = makeGrid(4, 4);
    spec.amplitudes[1][1] = 70.0;

    CHECK(extractPeaks(spec, 70.5).empty());
    CHECK(extractPeaks(spec, 70.0).size() == 1);
}

TEST_CASE("Border cells compare against the clipped window", "[peaks]") {
    Spectrogram spec = makeGrid(4, 4, 10.0);
    spec.amplitudes[0][0] = 60.0;
    spec.amplitudes[3][3] = 55.0;

    ConstellationMap peaks = extractPeaks(spec, 35.0);

    REQUIRE(peaks.size() == 2);
    CHECK(peaks[0].timeIdx == 0);
    CHECK(peaks[0].freqIdx == 0);
    CHECK(peaks[1].timeIdx == 3);
    CHECK(peaks[1].freqIdx == 3);
}

TEST_CASE("A plateau keeps only its first cell in row-major order", "[peaks]") {
    Spectrogram spec = makeGrid(4, 4);
    spec.amplitudes[1][1] = 50.0;
    spec.amplitudes[1][2] = 50.0;
    spec.amplitudes[2][1] = 50.0;

    ConstellationMap peaks = extractPeaks(spec, 35.0);

    REQUIRE(peaks.size() == 1);
    CHECK(peaks[0].freqIdx == 1);
    CHECK(peaks[0].timeIdx == 1);
}

TEST_CASE("Landmarks come out sorted by time then frequency", "[peaks]") {
    Spectrogram spec = makeGrid(6, 6);
    spec.amplitudes[0][5] = 50.0;
    spec.amplitudes[5][0] = 50.0;
    spec.amplitudes[4][3] = 45.0;
    spec.amplitudes[1][3] = 45.0;

    ConstellationMap peaks = extractPeaks(spec, 35.0);

    REQUIRE(peaks.size() == 4);
    CHECK(peaks[0].timeIdx == 0);
    CHECK(peaks[1].timeIdx == 3);
    CHECK(peaks[1].freqIdx == 1);
    CHECK(peaks[2].timeIdx == 3);
    CHECK(peaks[2].freqIdx == 4);
    CHECK(peaks[3].timeIdx == 5);
}

TEST_CASE("A wider window suppresses nearby weaker maxima", "[peaks]") {
    Spectrogram spec = makeGrid(5, 5);
    spec.amplitudes[2][1] = 50.0;
    spec.amplitudes[2][3] = 40.0;

    CHECK(extractPeaks(spec, 35.0, 3).size() == 2);

    ConstellationMap wide = extractPeaks(spec, 35.0, 5);
    REQUIRE(wide.size() == 1);
    CHECK(wide[0].timeIdx == 1);
}

TEST_CASE("Empty spectrogram gives an empty map", "[peaks]") {
    CHECK(extractPeaks(Spectrogram(), 35.0).empty());
}

TEST_CASE("Malformed spectrograms are rejected", "[peaks]") {
    SECTION("row count disagrees with frequency axis") {
        Spectrogram spec = makeGrid(3, 3);
        spec.amplitudes.pop_back();
        CHECK_THROWS_AS(extractPeaks(spec, 35.0), InvalidSpectrogram);
    }
    SECTION("row length disagrees with time axis") {
        Spectrogram spec = makeGrid(3, 3);
        spec.amplitudes[1].push_back(0.0);
        CHECK_THROWS_AS(extractPeaks(spec, 35.0), InvalidSpectrogram);
    }
    SECTION("time axis not strictly increasing") {
        Spectrogram spec = makeGrid(3, 3);
        spec.times[2] = spec.times[1];
        CHECK_THROWS_AS(extractPeaks(spec, 35.0), InvalidSpectrogram);
    }
    SECTION("NaN amplitude") {
        Spectrogram spec = makeGrid(3, 3);
        spec.amplitudes[0][0] = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(extractPeaks(spec, 35.0), InvalidSpectrogram);
    }
}

TEST_CASE("Peak window must be odd and at least three", "[peaks]") {
    Spectrogram spec = makeGrid(3, 3);
    CHECK_THROWS_AS(extractPeaks(spec, 35.0, 4), InvalidConfiguration);
    CHECK_THROWS_AS(extractPeaks(spec, 35.0, 1), InvalidConfiguration);

    PeakParams params;
    params.windowSize = 2;
    CHECK_THROWS_AS(extractPeaks(spec, params), InvalidConfiguration);
}

TEST_CASE("Extraction is deterministic", "[peaks]") {
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> dist(0.0, 80.0);
    Spectrogram spec = makeGrid(20, 30);
    for (auto& row : spec.amplitudes)
        for (double& v : row) v = dist(rng);

    ConstellationMap first = extractPeaks(spec, 30.0);
    ConstellationMap second = extractPeaks(spec, 30.0);

    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); i++) {
        CHECK(first[i].timeIdx == second[i].timeIdx);
        CHECK(first[i].freqIdx == second[i].freqIdx);
    }
}
