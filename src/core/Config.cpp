#include "Config.h"
#include "Errors.h"
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace Earmark {

namespace {

void requireFinite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(field + " must be finite");
    }
}

template <typename T>
void readField(const nlohmann::json& group, const char* key, const std::string& groupName, T& out) {
    if (!group.contains(key)) {
        return;
    }
    try {
        out = group.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfiguration(groupName + "." + key + ": " + e.what());
    }
}

const nlohmann::json* findGroup(const nlohmann::json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw InvalidConfiguration(std::string(name) + " must be an object");
    }
    return &(*it);
}

} // namespace

bool isPowerOfTwo(int value) {
    return value > 0 && (value & (value - 1)) == 0;
}

void SpectrogramParams::validate() const {
    if (!isPowerOfTwo(frameSize)) {
        throw InvalidConfiguration("frameSize must be a positive power of two, got " + std::to_string(frameSize));
    }
    if (!isPowerOfTwo(hopSize)) {
        throw InvalidConfiguration("hopSize must be a positive power of two, got " + std::to_string(hopSize));
    }
    if (hopSize > frameSize) {
        throw InvalidConfiguration("hopSize must not exceed frameSize");
    }
    requireFinite(topDb, "topDb");
}

void PeakParams::validate() const {
    requireFinite(amplitudeThreshold, "amplitudeThreshold");
    if (windowSize < 3 || windowSize % 2 == 0) {
        throw InvalidConfiguration("windowSize must be odd and >= 3, got " + std::to_string(windowSize));
    }
}

void TargetZone::validate() const {
    requireFinite(offsetTime, "offsetTime");
    requireFinite(offsetFreq, "offsetFreq");
    requireFinite(deltaTime, "deltaTime");
    requireFinite(deltaFreq, "deltaFreq");
    if (fanOut < 0) {
        throw InvalidConfiguration("fanOut must not be negative, got " + std::to_string(fanOut));
    }
    if (deltaTime <= 0.0 || deltaFreq <= 0.0) {
        throw InvalidConfiguration("target zone must have positive deltaTime and deltaFreq");
    }
}

void MatchConfig::validate() const {
    requireFinite(bucketWidth, "bucketWidth");
    if (bucketWidth <= 0.0) {
        throw InvalidConfiguration("bucketWidth must be positive");
    }
    if (minScore < 1) {
        throw InvalidConfiguration("minScore must be at least 1");
    }
    if (maxResults < 0) {
        throw InvalidConfiguration("maxResults must not be negative");
    }
}

void FingerprintConfig::validate() const {
    if (sampleRate <= 0) {
        throw InvalidConfiguration("sampleRate must be positive, got " + std::to_string(sampleRate));
    }
    spectrogram.validate();
    peaks.validate();
    targetZone.validate();
    match.validate();
}

FingerprintConfig configFromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw InvalidConfiguration("configuration root must be a JSON object");
    }

    FingerprintConfig config;
    readField(doc, "sampleRate", "config", config.sampleRate);

    if (const nlohmann::json* group = findGroup(doc, "spectrogram")) {
        readField(*group, "frameSize", "spectrogram", config.spectrogram.frameSize);
        readField(*group, "hopSize", "spectrogram", config.spectrogram.hopSize);
        readField(*group, "topDb", "spectrogram", config.spectrogram.topDb);
        readField(*group, "normalize", "spectrogram", config.spectrogram.normalize);
    }
    if (const nlohmann::json* group = findGroup(doc, "peaks")) {
        readField(*group, "amplitudeThreshold", "peaks", config.peaks.amplitudeThreshold);
        readField(*group, "windowSize", "peaks", config.peaks.windowSize);
    }
    if (const nlohmann::json* group = findGroup(doc, "targetZone")) {
        readField(*group, "offsetTime", "targetZone", config.targetZone.offsetTime);
        readField(*group, "offsetFreq", "targetZone", config.targetZone.offsetFreq);
        readField(*group, "deltaTime", "targetZone", config.targetZone.deltaTime);
        readField(*group, "deltaFreq", "targetZone", config.targetZone.deltaFreq);
        readField(*group, "fanOut", "targetZone", config.targetZone.fanOut);
    }
    if (const nlohmann::json* group = findGroup(doc, "match")) {
        readField(*group, "bucketWidth", "match", config.match.bucketWidth);
        readField(*group, "minScore", "match", config.match.minScore);
        readField(*group, "maxResults", "match", config.match.maxResults);
    }

    config.validate();
    return config;
}

FingerprintConfig loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidConfiguration("cannot open config file " + path);
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidConfiguration("failed to parse " + path + ": " + e.what());
    }
    return configFromJson(doc);
}

nlohmann::json configToJson(const FingerprintConfig& config) {
    nlohmann::json doc;
    doc["sampleRate"] = config.sampleRate;
    doc["spectrogram"] = {
        {"frameSize", config.spectrogram.frameSize},
        {"hopSize", config.spectrogram.hopSize},
        {"topDb", config.spectrogram.topDb},
        {"normalize", config.spectrogram.normalize}
    };
    doc["peaks"] = {
        {"amplitudeThreshold", config.peaks.amplitudeThreshold},
        {"windowSize", config.peaks.windowSize}
    };
    doc["targetZone"] = {
        {"offsetTime", config.targetZone.offsetTime},
        {"offsetFreq", config.targetZone.offsetFreq},
        {"deltaTime", config.targetZone.deltaTime},
        {"deltaFreq", config.targetZone.deltaFreq},
        {"fanOut", config.targetZone.fanOut}
    };
    doc["match"] = {
        {"bucketWidth", config.match.bucketWidth},
        {"minScore", config.match.minScore},
        {"maxResults", config.match.maxResults}
    };
    return doc;
}

std::string getEnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return fallback;
}

} // namespace Earmark
