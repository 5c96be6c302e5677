#include "SpectrogramProvider.h"
#include "../core/Errors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <new>

namespace Earmark {

namespace {

// FFTW's planner is not re-entrant; plan execution is
std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::vector<double> generateHannWindow(int length) {
    // Periodic form, matching the usual STFT convention
    std::vector<double> window(length);
    const double factor = 2.0 * M_PI / length;
    for (int i = 0; i < length; i++) {
        window[i] = 0.5 - 0.5 * std::cos(factor * i);
    }
    return window;
}

void powerToDb(std::vector<std::vector<double>>& power, double topDb) {
    double maxDb = -std::numeric_limits<double>::infinity();
    for (auto& row : power) {
        for (double& value : row) {
            value = 10.0 * std::log10(std::max(AMIN_POWER, value));
            maxDb = std::max(maxDb, value);
        }
    }

    if (topDb <= 0.0 || !std::isfinite(maxDb)) {
        return;
    }
    const double floorDb = maxDb - topDb;
    for (auto& row : power) {
        for (double& value : row) {
            value = std::max(value, floorDb);
        }
    }
}

void normalizeByPeak(std::vector<std::vector<double>>& db) {
    double maxDb = -std::numeric_limits<double>::infinity();
    for (const auto& row : db) {
        for (double value : row) {
            maxDb = std::max(maxDb, value);
        }
    }
    if (!(maxDb > 0.0) || !std::isfinite(maxDb)) {
        return;
    }
    for (auto& row : db) {
        for (double& value : row) {
            value /= maxDb;
        }
    }
}

FftwSpectrogramProvider::FftwSpectrogramProvider(const SpectrogramParams& params)
    : params(params), fftw_in(nullptr), fftw_out(nullptr), fftw_plan_forward(nullptr) {
    this->params.validate();

    const int fftSize = this->params.frameSize;
    hannWindow = generateHannWindow(fftSize);

    fftw_in = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * fftSize));
    fftw_out = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * fftSize));
    if (fftw_in == nullptr || fftw_out == nullptr) {
        fftw_free(fftw_in);
        fftw_free(fftw_out);
        throw std::bad_alloc();
    }

    std::lock_guard<std::mutex> lock(plannerMutex());
    fftw_plan_forward = fftw_plan_dft_1d(fftSize, fftw_in, fftw_out, FFTW_FORWARD, FFTW_MEASURE);
}

FftwSpectrogramProvider::~FftwSpectrogramProvider() {
    {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (fftw_plan_forward) {
            fftw_destroy_plan(fftw_plan_forward);
        }
    }
    fftw_free(fftw_in);
    fftw_free(fftw_out);
}

std::unique_ptr<SpectrogramProvider> FftwSpectrogramProvider::clone() const {
    return std::make_unique<FftwSpectrogramProvider>(params);
}

std::vector<double> FftwSpectrogramProvider::computePowerSpectrum(const std::vector<double>& frame) {
    const size_t fftSize = static_cast<size_t>(params.frameSize);

    for (size_t i = 0; i < fftSize; i++) {
        fftw_in[i][0] = i < frame.size() ? frame[i] * hannWindow[i] : 0.0;
        fftw_in[i][1] = 0.0;
    }

    fftw_execute(fftw_plan_forward);

    std::vector<double> power(fftSize / 2 + 1);
    for (size_t i = 0; i < power.size(); i++) {
        power[i] = fftw_out[i][0] * fftw_out[i][0] + fftw_out[i][1] * fftw_out[i][1];
    }
    return power;
}

Spectrogram FftwSpectrogramProvider::compute(const std::vector<double>& samples, int sampleRate) {
    if (sampleRate <= 0) {
        throw InvalidConfiguration("sampleRate must be positive, got " + std::to_string(sampleRate));
    }
    if (samples.empty()) {
        return Spectrogram();
    }

    const int nperseg = params.frameSize;
    const int step = params.hopSize;
    const long long pad = nperseg / 2;
    const long long length = static_cast<long long>(samples.size());

    // Frames are centred on t = frame * hop
    const int numSegments = static_cast<int>(1 + length / step);
    const int freqBins = nperseg / 2 + 1;

    std::vector<std::vector<double>> spectrogram(freqBins, std::vector<double>(numSegments));
    std::vector<double> frequencies(freqBins);
    std::vector<double> times(numSegments);

    const double freqStep = static_cast<double>(sampleRate) / nperseg;
    for (int i = 0; i < freqBins; i++) {
        frequencies[i] = i * freqStep;
    }

    const double timeStep = static_cast<double>(step) / sampleRate;
    for (int i = 0; i < numSegments; i++) {
        times[i] = i * timeStep;
    }

    std::vector<double> segment(nperseg);
    for (int seg = 0; seg < numSegments; seg++) {
        const long long start = static_cast<long long>(seg) * step - pad;
        for (int n = 0; n < nperseg; n++) {
            const long long idx = start + n;
            segment[n] = (idx >= 0 && idx < length) ? samples[idx] : 0.0;
        }

        std::vector<double> power = computePowerSpectrum(segment);
        for (int i = 0; i < freqBins; i++) {
            spectrogram[i][seg] = power[i];
        }
    }

    powerToDb(spectrogram, params.topDb);
    if (params.normalize) {
        normalizeByPeak(spectrogram);
    }
    return Spectrogram(times, frequencies, spectrogram);
}

} // namespace Earmark
