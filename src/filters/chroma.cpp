#include "filters/chroma.h"

#include <cmath>

#include "core/fft.h"
#include "util/exception.h"
#include "util/types.h"

namespace keybeat {

int hz_to_pitch_class(float hz, float reference_hz) {
  if (hz <= 0.0f || reference_hz <= 0.0f) {
    return -1;
  }

  int semitones = static_cast<int>(std::lround(12.0f * std::log2(hz / reference_hz)));
  return static_cast<int>(pitch_class(semitones));
}

int bin_pitch_class(int bin, int sr, int n_fft, const ChromaFoldConfig& config) {
  float freq = bin_frequency(bin, n_fft, sr);
  if (freq < config.fmin || freq > config.fmax) {
    return -1;
  }
  return hz_to_pitch_class(freq, config.reference_hz);
}

std::vector<float> create_chroma_fold_matrix(int sr, int n_fft, const ChromaFoldConfig& config) {
  KEYBEAT_CHECK(sr > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(n_fft > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK_MSG(config.fmin < config.fmax, ErrorCode::InvalidParameter,
                    "Chroma fmin must be below fmax");

  const int n_bins = n_fft / 2 + 1;
  std::vector<float> fold(key_constants::kNumPitchClasses * n_bins, 0.0f);

  // DC carries no pitch
  for (int k = 1; k < n_bins; ++k) {
    int pc = bin_pitch_class(k, sr, n_fft, config);
    if (pc >= 0) {
      fold[pc * n_bins + k] = 1.0f;
    }
  }

  return fold;
}

}  // namespace keybeat
