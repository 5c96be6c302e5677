#include <catch2/catch.hpp>

#include "audio/SpectrogramProvider.h"
#include "audio/AudioLoader.h"
#include "processing/PeakDetection.h"
#include "core/Errors.h"

#include <algorithm>
#include <cmath>

using namespace Earmark;

namespace {

std::vector<double> sineWave(double frequency, int sampleRate, double seconds) {
    std::vector<double> samples(static_cast<size_t>(sampleRate * seconds));
    for (size_t i = 0; i < samples.size(); i++) {
        samples[i] = std::sin(2.0 * M_PI * frequency * i / sampleRate);
    }
    return samples;
}

} // namespace

TEST_CASE("STFT framing follows frame and hop sizes", "[spectrogram]") {
    FftwSpectrogramProvider provider;
    Spectrogram spec = provider.compute(sineWave(440.0, 22050, 1.0), 22050);

    CHECK(spec.numFrequencies() == 1025);
    CHECK(spec.numTimes() == 1 + 22050 / 512);
    CHECK(spec.times[1] == Approx(512.0 / 22050.0));
    CHECK(spec.frequencies[1] == Approx(22050.0 / 2048.0));
    CHECK_NOTHROW(spec.validate());
}

TEST_CASE("A pure tone peaks at its frequency bin", "[spectrogram]") {
    FftwSpectrogramProvider provider;
    Spectrogram spec = provider.compute(sineWave(1000.0, 22050, 1.0), 22050);

    const size_t middle = spec.numTimes() / 2;
    size_t best = 0;
    for (size_t i = 1; i < spec.numFrequencies(); i++) {
        if (spec.amplitudes[i][middle] > spec.amplitudes[best][middle]) best = i;
    }
    CHECK(spec.frequencies[best] == Approx(1000.0).margin(22050.0 / 2048.0));

    ConstellationMap peaks = extractPeaks(spec, 35.0);
    REQUIRE_FALSE(peaks.empty());
    auto loudest = std::max_element(peaks.begin(), peaks.end(),
                                    [](const Landmark& a, const Landmark& b) { return a.amplitude < b.amplitude; });
    CHECK(loudest->frequency == Approx(1000.0).margin(2 * 22050.0 / 2048.0));
}

TEST_CASE("Decibel range is clipped below the loudest cell", "[spectrogram]") {
    std::vector<std::vector<double>> power = {{1.0, 0.0}, {1e-3, 1e-12}};
    powerToDb(power, 80.0);

    CHECK(power[0][0] == Approx(0.0));
    CHECK(power[0][1] == Approx(-80.0));
    CHECK(power[1][0] == Approx(-30.0));
    CHECK(power[1][1] == Approx(-80.0));
}

TEST_CASE("Periodic Hann window", "[spectrogram]") {
    std::vector<double> window = generateHannWindow(4);

    REQUIRE(window.size() == 4);
    CHECK(window[0] == Approx(0.0).margin(1e-12));
    CHECK(window[1] == Approx(0.5));
    CHECK(window[2] == Approx(1.0));
    CHECK(window[3] == Approx(0.5));
}

TEST_CASE("Spectrogram edge cases", "[spectrogram]") {
    FftwSpectrogramProvider provider;

    CHECK(provider.compute({}, 22050).empty());
    CHECK_THROWS_AS(provider.compute({0.1, 0.2}, 0), InvalidConfiguration);

    SpectrogramParams params;
    params.frameSize = 1000;
    CHECK_THROWS_AS(FftwSpectrogramProvider(params), InvalidConfiguration);

    std::unique_ptr<SpectrogramProvider> copy = provider.clone();
    CHECK(copy->compute(sineWave(440.0, 22050, 0.5), 22050).numFrequencies() == 1025);
}

TEST_CASE("Audio helpers downmix and resample", "[audio]") {
    std::vector<double> mono = downmixToMono({1.0, 0.0, 0.5, 0.5, -1.0, 1.0}, 2);
    REQUIRE(mono.size() == 3);
    CHECK(mono[0] == Approx(0.5));
    CHECK(mono[1] == Approx(0.5));
    CHECK(mono[2] == Approx(0.0));

    std::vector<double> ramp(100);
    for (size_t i = 0; i < ramp.size(); i++) ramp[i] = static_cast<double>(i);
    std::vector<double> half = resample(ramp, 44100, 22050);
    CHECK(half.size() == 50);
    CHECK(half[10] == Approx(20.0));

    CHECK(isSupportedFormat("song.MP3"));
    CHECK(isSupportedFormat("clip.flac"));
    CHECK_FALSE(isSupportedFormat("notes.txt"));
    CHECK_THROWS_AS(loadAudioFile("/nonexistent/track.wav"), AudioLoadError);
}

TEST_CASE("Peak normalization scales the loudest cell to one", "[spectrogram]") {
    std::vector<std::vector<double>> db = {{50.0, 25.0}, {10.0, -5.0}};
    normalizeByPeak(db);

    CHECK(db[0][0] == Approx(1.0));
    CHECK(db[0][1] == Approx(0.5));
    CHECK(db[1][1] == Approx(-0.1));

    std::vector<std::vector<double>> quiet = {{-20.0, -40.0}};
    normalizeByPeak(quiet);
    CHECK(quiet[0][0] == -20.0);

    SpectrogramParams params;
    params.normalize = true;
    FftwSpectrogramProvider provider(params);
    Spectrogram spec = provider.compute(sineWave(1000.0, 22050, 1.0), 22050);

    double loudest = -1e9;
    for (const auto& row : spec.amplitudes)
        for (double v : row) loudest = std::max(loudest, v);
    CHECK(loudest == Approx(1.0));

    ConstellationMap peaks = extractPeaks(spec, 0.8);
    REQUIRE_FALSE(peaks.empty());
    for (const auto& p : peaks) CHECK(p.amplitude >= 0.8);
}
