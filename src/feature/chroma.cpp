#include "feature/chroma.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <vector>

#include "core/frames.h"
#include "core/window.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace keybeat {

namespace {
constexpr float kMinEnergy = 1e-10f;

using FoldMatrix =
    Eigen::Matrix<float, key_constants::kNumPitchClasses, Eigen::Dynamic, Eigen::RowMajor>;

/// @brief Geometric mean / arithmetic mean of the magnitudes of bins with a pitch class.
float folded_flatness(const Eigen::VectorXf& magnitude, const Eigen::RowVectorXf& folded) {
  float sum = 0.0f;
  float log_sum = 0.0f;
  int count = 0;
  for (Eigen::Index k = 0; k < magnitude.size(); ++k) {
    if (folded(k) <= 0.0f) {
      continue;
    }
    float val = std::max(magnitude(k), kMinEnergy);
    sum += val;
    log_sum += std::log(val);
    ++count;
  }

  if (count == 0 || sum < kMinEnergy) {
    return 0.0f;
  }
  float arithmetic_mean = sum / static_cast<float>(count);
  float geometric_mean = std::exp(log_sum / static_cast<float>(count));
  return std::min(geometric_mean / arithmetic_mean, 1.0f);
}

}  // namespace

Chromagram::Chromagram() : total_energy_(0.0f), flatness_(0.0f), n_frames_(0) {
  values_.fill(0.0f);
}

Chromagram Chromagram::from_energy(const std::array<float, 12>& energy, int n_frames) {
  Chromagram chroma;
  chroma.n_frames_ = n_frames;

  float total = 0.0f;
  for (float e : energy) {
    KEYBEAT_CHECK(e >= 0.0f, ErrorCode::InvalidParameter);
    total += e;
  }
  if (total < kMinEnergy) {
    return chroma;
  }

  chroma.total_energy_ = total;
  for (int pc = 0; pc < key_constants::kNumPitchClasses; ++pc) {
    chroma.values_[pc] = energy[pc] / total;
  }
  return chroma;
}

Chromagram Chromagram::compute(const float* samples, size_t size, int sr, const FFT& fft,
                               const ChromaConfig& config, const CancellationToken* cancel) {
  KEYBEAT_CHECK(sr > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK_MSG(config.hop_length > 0 && config.hop_length <= config.n_fft,
                    ErrorCode::InvalidParameter, "Chroma hop must be in (0, n_fft]");

  // Validates n_fft and the frequency limits before any framing
  fft.plan(config.n_fft);
  std::vector<float> fold_data = create_chroma_fold_matrix(sr, config.n_fft, config.fold);

  const int n_frames = count_frames(size, config.n_fft, config.hop_length);
  if (n_frames == 0) {
    return Chromagram();
  }

  const int n_bins = config.n_fft / 2 + 1;
  const std::vector<float>& window = get_window_cached(config.window, config.n_fft);

  // Folding is linear, so summing magnitudes first equals folding every block
  Eigen::VectorXf magnitude_sum = Eigen::VectorXf::Zero(n_bins);
  std::vector<float> block;
  for (int t = 0; t < n_frames; ++t) {
    check_cancelled(cancel);
    extract_windowed_frame(samples, t, config.hop_length, window, block);
    std::vector<float> mags = fft.forward(block).magnitudes(n_bins);
    magnitude_sum += Eigen::Map<const Eigen::VectorXf>(mags.data(), n_bins);
  }

  Eigen::Map<const FoldMatrix> fold(fold_data.data(), key_constants::kNumPitchClasses, n_bins);
  Eigen::Matrix<float, key_constants::kNumPitchClasses, 1> energy = fold * magnitude_sum;

  std::array<float, 12> raw;
  for (int pc = 0; pc < key_constants::kNumPitchClasses; ++pc) {
    raw[pc] = energy(pc);
  }
  Chromagram chroma = from_energy(raw, n_frames);
  if (!chroma.silent()) {
    chroma.flatness_ = folded_flatness(magnitude_sum, fold.colwise().sum());
  }
  return chroma;
}

Chromagram Chromagram::compute(const SampleBuffer& buffer, const FFT& fft,
                               const ChromaConfig& config, const CancellationToken* cancel) {
  if (buffer.empty()) {
    return Chromagram();
  }
  std::vector<float> mono = buffer.mono_mix();
  return compute(mono.data(), mono.size(), buffer.sample_rate(), fft, config, cancel);
}

PitchClass Chromagram::dominant() const {
  return pitch_class(static_cast<int>(argmax(values_.data(), values_.size())));
}

}  // namespace keybeat
