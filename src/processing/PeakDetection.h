#ifndef EARMARK_PEAK_DETECTION_H
#define EARMARK_PEAK_DETECTION_H

#include "../utils/Types.h"
#include "../core/Config.h"
#include <vector>

namespace Earmark {

// True when (i, j) beats every neighbour inside the clipped window.
// Equal neighbours earlier in row-major order suppress (i, j).
bool isLocalMaximum(const std::vector<std::vector<double>>& matrix, int i, int j, int halfWindow);

// Constellation map of local maxima at or above amplitudeThreshold (dB).
// An empty map is a valid result, not an error.
ConstellationMap extractPeaks(const Spectrogram& spec, double amplitudeThreshold,
                              int windowSize = PEAK_WINDOW_SIZE);
ConstellationMap extractPeaks(const Spectrogram& spec, const PeakParams& params);

} // namespace Earmark

#endif
