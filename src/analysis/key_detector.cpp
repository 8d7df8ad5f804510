#include "analysis/key_detector.h"

#include <algorithm>

#include "util/exception.h"

namespace keybeat {

std::string KeyEstimate::to_string() const {
  return std::string(pitch_class_name(root)) + " " + mode_name(mode);
}

std::string KeyEstimate::to_short_string() const {
  std::string name = pitch_class_name(root);
  if (mode == Mode::Minor) {
    name += "m";
  }
  return name;
}

KeyDetector::KeyDetector(const SampleBuffer& buffer, const KeyConfig& config)
    : KeyDetector(buffer, config, FFT()) {}

KeyDetector::KeyDetector(const SampleBuffer& buffer, const KeyConfig& config, const FFT& fft,
                         const CancellationToken* cancel)
    : config_(config), chroma_(Chromagram::compute(buffer, fft, config.chroma, cancel)) {
  analyze();
}

KeyDetector::KeyDetector(const float* samples, size_t size, int sr, const KeyConfig& config,
                         const FFT& fft, const CancellationToken* cancel)
    : config_(config),
      chroma_(size == 0 ? Chromagram()
                        : Chromagram::compute(samples, size, sr, fft, config.chroma, cancel)) {
  analyze();
}

KeyDetector::KeyDetector(const Chromagram& chroma, const KeyConfig& config)
    : config_(config), chroma_(chroma) {
  analyze();
}

void KeyDetector::analyze() {
  KEYBEAT_CHECK_MSG(config_.max_flatness >= 0.0f && config_.max_flatness <= 1.0f,
                    ErrorCode::InvalidParameter, "Key flatness limit must be in [0, 1]");
  if (chroma_.silent() || chroma_.flatness() > config_.max_flatness) {
    return;
  }

  const std::array<float, 12>& values = chroma_.values();
  candidates_.reserve(24);
  for (int pc = 0; pc < 12; ++pc) {
    PitchClass root = pitch_class(pc);
    for (Mode mode : {Mode::Major, Mode::Minor}) {
      KeyEstimate estimate;
      estimate.root = root;
      estimate.mode = mode;
      estimate.score = profile_correlation(values, get_profile(root, mode, config_.profile_type),
                                           config_.match);
      estimate.detected = true;
      candidates_.push_back(estimate);
    }
  }

  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const KeyEstimate& a, const KeyEstimate& b) { return a.score > b.score; });
  key_ = candidates_.front();
}

std::vector<KeyEstimate> KeyDetector::candidates(int top_n) const {
  size_t n = std::min(static_cast<size_t>(std::max(top_n, 0)), candidates_.size());
  return std::vector<KeyEstimate>(candidates_.begin(), candidates_.begin() + n);
}

KeyEstimate detect_key(const SampleBuffer& buffer, const KeyConfig& config) {
  KeyDetector detector(buffer, config);
  return detector.key();
}

}  // namespace keybeat
