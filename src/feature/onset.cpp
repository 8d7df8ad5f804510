#include "feature/onset.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

#include "core/frames.h"
#include "core/window.h"
#include "filters/mel.h"
#include "util/exception.h"

namespace keybeat {

namespace {

// Absolute power floor, reached only by silence
constexpr float kAmin = 1e-10f;

using RowMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

void validate(const OnsetConfig& config) {
  KEYBEAT_CHECK_MSG(config.frame_size > 0, ErrorCode::InvalidParameter,
                    "Onset frame size must be positive");
  KEYBEAT_CHECK_MSG(config.hop_length > 0 && config.hop_length <= config.frame_size,
                    ErrorCode::InvalidParameter, "Onset hop must be in (0, frame_size]");
  KEYBEAT_CHECK_MSG(config.n_mels > 0, ErrorCode::InvalidParameter,
                    "Onset Mel band count must be positive");
  KEYBEAT_CHECK(config.top_db > 0.0f, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(config.threshold >= 0.0f, ErrorCode::InvalidParameter);
}

}  // namespace

std::vector<float> compute_log_mel_flux(const float* samples, size_t size, int sr, const FFT& fft,
                                        const OnsetConfig& config,
                                        const CancellationToken* cancel) {
  validate(config);

  const int n_frames = count_frames(size, config.frame_size, config.hop_length);
  if (n_frames == 0) {
    return {};
  }
  KEYBEAT_CHECK_MSG(sr > 0, ErrorCode::InvalidParameter, "Sample rate must be positive");

  // Fetch the plan up front so a bad frame size fails before any work
  fft.plan(config.frame_size);

  const int n_bins = config.frame_size / 2 + 1;
  MelFilterConfig mel_config;
  mel_config.n_mels = config.n_mels;
  const std::vector<float> filterbank = create_mel_filterbank(sr, config.frame_size, mel_config);
  Eigen::Map<const RowMatrixXf> fb(filterbank.data(), config.n_mels, n_bins);

  const std::vector<float>& window = get_window_cached(config.window, config.frame_size);

  /// Band power [n_mels x n_frames]
  Eigen::MatrixXf mel_power(config.n_mels, n_frames);
  std::vector<float> block;
  for (int t = 0; t < n_frames; ++t) {
    check_cancelled(cancel);

    extract_windowed_frame(samples, t, config.hop_length, window, block);
    std::vector<float> power = fft.forward(block).powers(n_bins);
    mel_power.col(t).noalias() = fb * Eigen::Map<const Eigen::VectorXf>(power.data(), n_bins);
  }

  std::vector<float> flux(n_frames, 0.0f);
  if (n_frames < 2) {
    return flux;
  }

  /// Log power, floored top_db below the loudest band
  const float range = std::pow(10.0f, -config.top_db / 10.0f);
  const float amin = std::max(mel_power.maxCoeff() * range, kAmin);
  Eigen::ArrayXXf log_power = mel_power.array().max(amin).log();

  /// First difference, half-wave rectification, mean over bands
  const int diff_frames = n_frames - 1;
  Eigen::ArrayXXf rise =
      (log_power.rightCols(diff_frames) - log_power.leftCols(diff_frames)).max(0.0f);
  Eigen::Map<Eigen::ArrayXf> flux_map(flux.data() + 1, diff_frames);
  flux_map = rise.colwise().mean().transpose();

  return flux;
}

std::vector<float> compute_onset_envelope(const float* samples, size_t size, int sr,
                                          const FFT& fft, const OnsetConfig& config,
                                          const CancellationToken* cancel) {
  std::vector<float> envelope = compute_log_mel_flux(samples, size, sr, fft, config, cancel);
  if (envelope.empty()) {
    return envelope;
  }

  Eigen::Map<Eigen::ArrayXf> env(envelope.data(), static_cast<Eigen::Index>(envelope.size()));
  env = (env < config.threshold).select(0.0f, env);
  return envelope;
}

}  // namespace keybeat
