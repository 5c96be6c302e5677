#ifndef EARMARK_SPECTROGRAM_PROVIDER_H
#define EARMARK_SPECTROGRAM_PROVIDER_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include <fftw3.h>
#include <memory>
#include <vector>

namespace Earmark {

// Turns mono samples into a dB spectrogram. Implementations hold scratch
// buffers, so one instance must not be shared between threads; clone() one
// per worker instead.
class SpectrogramProvider {
public:
    virtual ~SpectrogramProvider() = default;

    virtual Spectrogram compute(const std::vector<double>& samples, int sampleRate) = 0;
    virtual std::unique_ptr<SpectrogramProvider> clone() const = 0;
};

// Centred, Hann-windowed STFT through FFTW, power converted to dB and
// clipped to topDb below the loudest cell
class FftwSpectrogramProvider : public SpectrogramProvider {
private:
    SpectrogramParams params;
    std::vector<double> hannWindow;
    fftw_complex *fftw_in;
    fftw_complex *fftw_out;
    fftw_plan fftw_plan_forward;

public:
    explicit FftwSpectrogramProvider(const SpectrogramParams& params = SpectrogramParams());
    ~FftwSpectrogramProvider() override;

    FftwSpectrogramProvider(const FftwSpectrogramProvider&) = delete;
    FftwSpectrogramProvider& operator=(const FftwSpectrogramProvider&) = delete;

    Spectrogram compute(const std::vector<double>& samples, int sampleRate) override;
    std::unique_ptr<SpectrogramProvider> clone() const override;

    // Power spectrum (|X|^2) of one windowed frame, frameSize/2 + 1 bins
    std::vector<double> computePowerSpectrum(const std::vector<double>& frame);

    const SpectrogramParams& parameters() const { return params; }
};

std::vector<double> generateHannWindow(int length);

// 10*log10(max(amin, power)), floored at (max - topDb) when topDb > 0
void powerToDb(std::vector<std::vector<double>>& power, double topDb);

// Scales dB values so the loudest cell becomes 1.0. Left unchanged when the
// loudest cell is not above 0 dB.
void normalizeByPeak(std::vector<std::vector<double>>& db);

} // namespace Earmark

#endif
