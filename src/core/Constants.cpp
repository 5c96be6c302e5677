#include "Constants.h"

namespace Earmark {

const int SAMPLE_RATE = 22050;

const int FRAME_SIZE = 2048;
const int HOP_SIZE = 512;
const double TOP_DB = 80.0;
const double AMIN_POWER = 1e-10;

// Sparse enough for ~10-30 landmarks per second on typical music
const double AMPLITUDE_THRESHOLD = 35.0;
const int PEAK_WINDOW_SIZE = 3;

const double TARGET_OFFSET_TIME = 1.0;
const double TARGET_OFFSET_FREQ = 500.0;
const double TARGET_DELTA_TIME = 10.0;
const double TARGET_DELTA_FREQ = 1000.0;
const int TARGET_FAN_OUT = 10;

const double OFFSET_BUCKET_WIDTH = 0.2;
const int MIN_MATCH_SCORE = 1;
const int MAX_MATCH_RESULTS = 0;

const char* const DEFAULT_DB_PATH = "fingerprints.db";
const char* const DB_PATH_ENV = "EARMARK_DB_PATH";
const char* const CONFIG_PATH_ENV = "EARMARK_CONFIG";
const int TOP_MATCHES_DISPLAYED = 10;

} // namespace Earmark
