#ifndef EARMARK_CONSTANTS_H
#define EARMARK_CONSTANTS_H

namespace Earmark {

// Audio
extern const int SAMPLE_RATE;

// Spectrogram
extern const int FRAME_SIZE;              // STFT window length in samples
extern const int HOP_SIZE;                // Samples between successive frames
extern const double TOP_DB;               // Dynamic range kept below the loudest cell
extern const double AMIN_POWER;           // Power floor before taking log10

// Peak extraction
extern const double AMPLITUDE_THRESHOLD;  // dB
extern const int PEAK_WINDOW_SIZE;        // Odd side length of the local-max window

// Target zone
extern const double TARGET_OFFSET_TIME;   // seconds
extern const double TARGET_OFFSET_FREQ;   // Hz
extern const double TARGET_DELTA_TIME;    // seconds
extern const double TARGET_DELTA_FREQ;    // Hz
extern const int TARGET_FAN_OUT;          // Max targets paired with one anchor

// Matching
extern const double OFFSET_BUCKET_WIDTH;  // seconds
extern const int MIN_MATCH_SCORE;
extern const int MAX_MATCH_RESULTS;       // 0 = unlimited

// Drivers
extern const char* const DEFAULT_DB_PATH;
extern const char* const DB_PATH_ENV;
extern const char* const CONFIG_PATH_ENV;
extern const int TOP_MATCHES_DISPLAYED;

} // namespace Earmark

#endif
