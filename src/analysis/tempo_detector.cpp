#include "analysis/tempo_detector.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <utility>

#include "util/exception.h"
#include "util/math_utils.h"

namespace keybeat {

namespace {

// Below this lag-0 energy the envelope is treated as flat
constexpr float kMinEnvelopeEnergy = 1e-10f;

}  // namespace

OnsetConfig TempoConfig::onset_config() const {
  OnsetConfig onset;
  onset.frame_size = frame_size;
  onset.hop_length = hop_length;
  onset.window = window;
  onset.threshold = onset_threshold;
  return onset;
}

float lag_to_bpm(float lag, int sr, int hop_length) {
  if (lag <= 0.0f || hop_length <= 0) {
    return 0.0f;
  }
  return 60.0f * static_cast<float>(sr) / (static_cast<float>(hop_length) * lag);
}

float bpm_to_lag(float bpm, int sr, int hop_length) {
  if (bpm <= 0.0f || hop_length <= 0) {
    return 0.0f;
  }
  return 60.0f * static_cast<float>(sr) / (static_cast<float>(hop_length) * bpm);
}

float fold_tempo_octave(float bpm, float bpm_min, float bpm_max) {
  if (bpm <= 0.0f || !std::isfinite(bpm)) {
    return 0.0f;
  }
  while (bpm < bpm_min) {
    bpm *= 2.0f;
  }
  while (bpm > bpm_max) {
    bpm *= 0.5f;
  }
  return bpm;
}

std::vector<float> autocorrelate(const std::vector<float>& signal, int max_lag, const FFT& fft) {
  const int n = static_cast<int>(signal.size());
  if (n == 0 || max_lag < 0) {
    return {};
  }
  const int n_lags = std::min(max_lag, n - 1) + 1;

  // Zero padding to >= 2n turns the circular correlation into a linear one
  const int fft_size = next_power_of_2(2 * n);
  std::vector<float> padded(fft_size, 0.0f);
  std::copy(signal.begin(), signal.end(), padded.begin());

  SpectralFrame spectrum = fft.forward(padded);
  std::vector<std::complex<float>> power(fft_size);
  for (int k = 0; k < fft_size; ++k) {
    power[k] = std::complex<float>(std::norm(spectrum[k]), 0.0f);
  }

  std::vector<float> full = fft.inverse_real(SpectralFrame(std::move(power)));
  full.resize(n_lags);
  return full;
}

TempoDetector::TempoDetector(const SampleBuffer& buffer, const TempoConfig& config)
    : TempoDetector(buffer, config, FFT()) {}

TempoDetector::TempoDetector(const SampleBuffer& buffer, const TempoConfig& config,
                             const FFT& fft, const CancellationToken* cancel)
    : config_(config) {
  validate();
  std::vector<float> mono = buffer.mono_mix();
  envelope_ = compute_onset_envelope(mono.data(), mono.size(), buffer.sample_rate(), fft,
                                     config_.onset_config(), cancel);
  analyze(buffer.sample_rate(), fft);
}

TempoDetector::TempoDetector(const float* samples, size_t size, int sr, const TempoConfig& config,
                             const FFT& fft, const CancellationToken* cancel)
    : config_(config) {
  validate();
  envelope_ = compute_onset_envelope(samples, size, sr, fft, config_.onset_config(), cancel);
  analyze(sr, fft);
}

TempoDetector::TempoDetector(std::vector<float> envelope, int sr, const TempoConfig& config,
                             const FFT& fft)
    : config_(config), envelope_(std::move(envelope)) {
  validate();
  analyze(sr, fft);
}

void TempoDetector::validate() const {
  KEYBEAT_CHECK_MSG(config_.hop_length > 0 && config_.hop_length <= config_.frame_size,
                    ErrorCode::InvalidParameter, "Tempo hop must be in (0, frame_size]");
  KEYBEAT_CHECK_MSG(config_.bpm_min > 0.0f && config_.bpm_min < config_.bpm_max,
                    ErrorCode::InvalidParameter, "Tempo range must satisfy 0 < bpm_min < bpm_max");
}

void TempoDetector::analyze(int sr, const FFT& fft) {
  if (sr <= 0 || envelope_.size() < 2) {
    return;
  }

  const int n = static_cast<int>(envelope_.size());
  const int hop = config_.hop_length;

  // Fast tempo = short lag
  const int lag_min =
      std::max(1, static_cast<int>(std::ceil(bpm_to_lag(config_.bpm_max, sr, hop))));
  const int lag_max =
      std::min(static_cast<int>(std::floor(bpm_to_lag(config_.bpm_min, sr, hop))), n - 1);
  if (lag_min > lag_max) {
    return;
  }

  std::vector<float> centered(envelope_);
  float env_mean = mean(centered.data(), centered.size());
  for (float& v : centered) {
    v -= env_mean;
  }

  // One extra lag so the peak at lag_max still has a right neighbour
  autocorr_ = autocorrelate(centered, lag_max + 1, fft);
  const float energy = autocorr_[0];
  if (!(energy > kMinEnvelopeEnergy)) {
    return;
  }

  const int n_lags = static_cast<int>(autocorr_.size());
  int best = 0;
  float best_score = 0.0f;
  for (int lag = lag_min; lag <= lag_max; ++lag) {
    const float value = autocorr_[lag];
    if (value <= 0.0f) {
      continue;
    }
    const float left = autocorr_[lag - 1];
    const float right = lag + 1 < n_lags ? autocorr_[lag + 1] : 0.0f;
    if (value < left || value < right) {
      continue;
    }

    float bpm = fold_tempo_octave(lag_to_bpm(static_cast<float>(lag), sr, hop), config_.bpm_min,
                                  config_.bpm_max);
    candidates_.push_back({bpm, std::clamp(value / energy, 0.0f, 1.0f), lag});

    const float score = value + std::max({left, right, 0.0f});
    if (best == 0 || score > best_score) {
      best = lag;
      best_score = score;
    }
  }
  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const TempoCandidate& a, const TempoCandidate& b) {
                     return a.strength > b.strength;
                   });
  if (best == 0) {
    return;
  }

  float refined = static_cast<float>(best);
  if (best + 1 < n_lags) {
    refined += parabolic_peak_offset(autocorr_[best - 1], autocorr_[best], autocorr_[best + 1]);
  }

  best_lag_ = best;
  estimate_.bpm = fold_tempo_octave(lag_to_bpm(refined, sr, hop), config_.bpm_min, config_.bpm_max);
  estimate_.confidence = std::clamp(autocorr_[best] / energy, 0.0f, 1.0f);
}

std::vector<TempoCandidate> TempoDetector::candidates(int top_n) const {
  size_t n = std::min(static_cast<size_t>(std::max(top_n, 0)), candidates_.size());
  return std::vector<TempoCandidate>(candidates_.begin(), candidates_.begin() + n);
}

TempoEstimate detect_tempo(const SampleBuffer& buffer, const TempoConfig& config) {
  TempoDetector detector(buffer, config);
  return detector.estimate();
}

}  // namespace keybeat
