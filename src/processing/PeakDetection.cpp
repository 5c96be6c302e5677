#include "PeakDetection.h"
#include "../core/Errors.h"
#include <algorithm>
#include <string>

namespace Earmark {

bool isLocalMaximum(const std::vector<std::vector<double>>& matrix, int i, int j, int halfWindow) {
    const double centerValue = matrix[i][j];
    const int rows = static_cast<int>(matrix.size());
    const int cols = static_cast<int>(matrix[0].size());

    const int iMin = std::max(0, i - halfWindow);
    const int iMax = std::min(rows - 1, i + halfWindow);
    const int jMin = std::max(0, j - halfWindow);
    const int jMax = std::min(cols - 1, j + halfWindow);

    for (int ni = iMin; ni <= iMax; ni++) {
        for (int nj = jMin; nj <= jMax; nj++) {
            if (ni == i && nj == j) continue;

            const double neighborValue = matrix[ni][nj];
            if (neighborValue > centerValue) {
                return false;
            }
            // Plateau: only the first cell in scan order survives
            if (neighborValue == centerValue && (ni < i || (ni == i && nj < j))) {
                return false;
            }
        }
    }
    return true;
}

ConstellationMap extractPeaks(const Spectrogram& spec, double amplitudeThreshold, int windowSize) {
    if (windowSize < 3 || windowSize % 2 == 0) {
        throw InvalidConfiguration("peak window size must be odd and >= 3, got " + std::to_string(windowSize));
    }
    spec.validate();

    ConstellationMap peaks;
    if (spec.empty()) {
        return peaks;
    }

    const auto& Sxx = spec.amplitudes;
    const int rows = static_cast<int>(spec.numFrequencies());
    const int cols = static_cast<int>(spec.numTimes());
    const int halfWindow = windowSize / 2;

    for (int i = 0; i < rows; i++) {
        for (int j = 0; j < cols; j++) {
            if (Sxx[i][j] >= amplitudeThreshold && isLocalMaximum(Sxx, i, j, halfWindow)) {
                peaks.emplace_back(spec.times[j], spec.frequencies[i], j, i, Sxx[i][j]);
            }
        }
    }

    // Row-major scan yields frequency order; hashing needs time order
    std::sort(peaks.begin(), peaks.end(),
              [](const Landmark& a, const Landmark& b) {
                  if (a.time != b.time) {
                      return a.time < b.time;
                  }
                  return a.frequency < b.frequency;
              });

    return peaks;
}

ConstellationMap extractPeaks(const Spectrogram& spec, const PeakParams& params) {
    params.validate();
    return extractPeaks(spec, params.amplitudeThreshold, params.windowSize);
}

} // namespace Earmark
