#include <catch2/catch.hpp>

#include "core/Config.h"
#include "core/Errors.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace Earmark;
using nlohmann::json;

TEST_CASE("Defaults are valid and match the documented constants", "[config]") {
    FingerprintConfig config;
    REQUIRE_NOTHROW(config.validate());

    CHECK(config.sampleRate == SAMPLE_RATE);
    CHECK(config.spectrogram.frameSize == 2048);
    CHECK(config.spectrogram.hopSize == 512);
    CHECK(config.peaks.amplitudeThreshold == 35.0);
    CHECK(config.targetZone.offsetTime == 1.0);
    CHECK(config.targetZone.offsetFreq == 500.0);
    CHECK(config.targetZone.deltaTime == 10.0);
    CHECK(config.targetZone.deltaFreq == 1000.0);
    CHECK(config.targetZone.fanOut == 10);
    CHECK(config.match.bucketWidth == Approx(0.2));
}

TEST_CASE("Absent JSON keys keep their defaults", "[config]") {
    FingerprintConfig config = configFromJson(json::parse(R"({"targetZone": {"fanOut": 3}, "match": {"maxResults": 5}})"));

    CHECK(config.targetZone.fanOut == 3);
    CHECK(config.targetZone.deltaTime == TARGET_DELTA_TIME);
    CHECK(config.match.maxResults == 5);
    CHECK(config.spectrogram.frameSize == FRAME_SIZE);
    CHECK_FALSE(config.spectrogram.normalize);

    FingerprintConfig normalized = configFromJson(json::parse(R"({"spectrogram": {"normalize": true}})"));
    CHECK(normalized.spectrogram.normalize);
    CHECK(configToJson(normalized)["spectrogram"]["normalize"] == true);
}

TEST_CASE("Malformed JSON configuration is rejected", "[config]") {
    CHECK_THROWS_AS(configFromJson(json::array()), InvalidConfiguration);
    CHECK_THROWS_AS(configFromJson(json::parse(R"({"peaks": 4})")), InvalidConfiguration);
    CHECK_THROWS_AS(configFromJson(json::parse(R"({"peaks": {"windowSize": "big"}})")), InvalidConfiguration);
    CHECK_THROWS_AS(configFromJson(json::parse(R"({"spectrogram": {"frameSize": 1000}})")), InvalidConfiguration);
    CHECK_THROWS_AS(configFromJson(json::parse(R"({"spectrogram": {"frameSize": 512, "hopSize": 1024}})")),
                    InvalidConfiguration);
    CHECK_THROWS_AS(configFromJson(json::parse(R"({"sampleRate": 0})")), InvalidConfiguration);
}

TEST_CASE("Serialized configuration reads back unchanged", "[config]") {
    FingerprintConfig config;
    config.sampleRate = 44100;
    config.peaks.windowSize = 5;
    config.targetZone = TargetZone(0.5, 200.0, 4.0, 800.0, 6);
    config.match.minScore = 3;

    FingerprintConfig restored = configFromJson(configToJson(config));

    CHECK(restored.sampleRate == 44100);
    CHECK(restored.peaks.windowSize == 5);
    CHECK(restored.targetZone.offsetTime == 0.5);
    CHECK(restored.targetZone.deltaFreq == 800.0);
    CHECK(restored.targetZone.fanOut == 6);
    CHECK(restored.match.minScore == 3);
}

TEST_CASE("Config files load from disk", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "earmark_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"peaks": {"amplitudeThreshold": 20.5}})";
    }

    FingerprintConfig config = loadConfigFile(path.string());
    CHECK(config.peaks.amplitudeThreshold == 20.5);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_THROWS_AS(loadConfigFile(path.string()), InvalidConfiguration);

    std::filesystem::remove(path);
    CHECK_THROWS_AS(loadConfigFile(path.string()), InvalidConfiguration);
}

TEST_CASE("Individual parameter groups validate their ranges", "[config]") {
    CHECK_THROWS_AS(TargetZone(1.0, 0.0, 0.0, 100.0, 1).validate(), InvalidConfiguration);
    CHECK_THROWS_AS(TargetZone(1.0, 0.0, 1.0, 100.0, -2).validate(), InvalidConfiguration);
    CHECK_THROWS_AS(TargetZone(1.0, std::numeric_limits<double>::infinity(), 1.0, 100.0, 1).validate(),
                    InvalidConfiguration);
    CHECK_NOTHROW(TargetZone(-1.0, -100.0, 1.0, 100.0, 0).validate());

    PeakParams peaks;
    peaks.amplitudeThreshold = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(peaks.validate(), InvalidConfiguration);

    CHECK(isPowerOfTwo(1024));
    CHECK_FALSE(isPowerOfTwo(0));
    CHECK_FALSE(isPowerOfTwo(1000));
}

TEST_CASE("Environment lookups fall back when unset", "[config]") {
    unsetenv("EARMARK_TEST_UNSET");
    CHECK(getEnvOr("EARMARK_TEST_UNSET", "fallback") == "fallback");

    setenv("EARMARK_TEST_SET", "custom.db", 1);
    CHECK(getEnvOr("EARMARK_TEST_SET", "fallback") == "custom.db");

    setenv("EARMARK_TEST_SET", "", 1);
    CHECK(getEnvOr("EARMARK_TEST_SET", "fallback") == "fallback");
    unsetenv("EARMARK_TEST_SET");
}
