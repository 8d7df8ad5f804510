#include "filters/mel.h"

#include <cmath>

#include "util/exception.h"

namespace keybeat {

namespace {

constexpr float kMelFSp = 200.0f / 3.0f;
constexpr float kMinLogHz = 1000.0f;
constexpr float kMinLogMel = kMinLogHz / kMelFSp;  // 15.0

inline float log_step() {
  static const float value = std::log(6.4f) / 27.0f;
  return value;
}

}  // namespace

float hz_to_mel(float hz) {
  if (hz < kMinLogHz) {
    return hz / kMelFSp;
  }
  return kMinLogMel + std::log(hz / kMinLogHz) / log_step();
}

float mel_to_hz(float mel) {
  if (mel < kMinLogMel) {
    return kMelFSp * mel;
  }
  return kMinLogHz * std::exp(log_step() * (mel - kMinLogMel));
}

std::vector<float> mel_frequencies(int n_mels, float fmin, float fmax) {
  KEYBEAT_CHECK(n_mels > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(fmax > fmin, ErrorCode::InvalidParameter);

  const float mel_min = hz_to_mel(fmin);
  const float mel_max = hz_to_mel(fmax);

  const int n_points = n_mels + 2;
  std::vector<float> freqs(n_points);
  for (int i = 0; i < n_points; ++i) {
    float mel = mel_min + (mel_max - mel_min) * i / (n_points - 1);
    freqs[i] = mel_to_hz(mel);
  }
  return freqs;
}

std::vector<float> create_mel_filterbank(int sr, int n_fft, const MelFilterConfig& config) {
  KEYBEAT_CHECK(sr > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(n_fft > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK_MSG(config.n_mels > 0, ErrorCode::InvalidParameter,
                    "Mel band count must be positive");

  const int n_bins = n_fft / 2 + 1;
  const float nyquist = static_cast<float>(sr) / 2.0f;
  const float fmax = config.fmax > 0.0f ? config.fmax : nyquist;
  KEYBEAT_CHECK(config.fmin >= 0.0f && fmax > config.fmin, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(fmax <= nyquist, ErrorCode::InvalidParameter);

  std::vector<float> mel_freqs = mel_frequencies(config.n_mels, config.fmin, fmax);

  // Band edges in (fractional) bins
  const float bin_width = static_cast<float>(sr) / n_fft;
  std::vector<float> edges(mel_freqs.size());
  for (size_t i = 0; i < mel_freqs.size(); ++i) {
    edges[i] = mel_freqs[i] / bin_width;
  }

  std::vector<float> filterbank(static_cast<size_t>(config.n_mels) * n_bins, 0.0f);
  for (int m = 0; m < config.n_mels; ++m) {
    const float left = edges[m];
    const float center = edges[m + 1];
    const float right = edges[m + 2];
    const float enorm = 2.0f / (mel_freqs[m + 2] - mel_freqs[m]);
    float* row = filterbank.data() + static_cast<size_t>(m) * n_bins;

    for (int k = 0; k < n_bins; ++k) {
      const float bin = static_cast<float>(k);
      float weight = 0.0f;
      if (bin >= left && bin <= center && center > left) {
        weight = (bin - left) / (center - left);
      } else if (bin > center && bin <= right && right > center) {
        weight = (right - bin) / (right - center);
      }
      row[k] = weight * enorm;
    }
  }

  return filterbank;
}

}  // namespace keybeat
