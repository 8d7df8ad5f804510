#include "core/waveform.h"

#include <algorithm>
#include <cmath>

namespace keybeat {

std::vector<float> waveform_peaks(const SampleBuffer& buffer, int points) {
  if (buffer.empty() || points <= 0) {
    return {};
  }

  const float* samples = buffer.channel(0);
  const size_t block_size = buffer.size() / static_cast<size_t>(points);

  std::vector<float> peaks(points, 0.0f);
  for (int i = 0; i < points; ++i) {
    const float* block = samples + static_cast<size_t>(i) * block_size;
    float peak = 0.0f;
    for (size_t j = 0; j < block_size; ++j) {
      peak = std::max(peak, std::abs(block[j]));
    }
    peaks[i] = peak;
  }
  return peaks;
}

}  // namespace keybeat
