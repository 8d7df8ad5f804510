#pragma once

/// @file frames.h
/// @brief Overlapping frame segmentation helpers.

#include <cstddef>
#include <vector>

namespace keybeat {

/// @brief Number of full frames in a signal.
/// @param n_samples Signal length
/// @param frame_size Frame length
/// @param hop_length Hop between frame starts
/// @return floor((n_samples - frame_size) / hop_length) + 1, or 0 if the signal is shorter
///         than one frame
inline int count_frames(size_t n_samples, int frame_size, int hop_length) {
  if (frame_size <= 0 || hop_length <= 0 || n_samples < static_cast<size_t>(frame_size)) {
    return 0;
  }
  return static_cast<int>((n_samples - static_cast<size_t>(frame_size)) /
                          static_cast<size_t>(hop_length)) +
         1;
}

/// @brief Copies frame `index` of a signal into `out` and applies a window.
/// @param samples Signal
/// @param index Frame index (frame starts at index * hop_length)
/// @param hop_length Hop between frame starts
/// @param window Window coefficients; out is resized to its length
/// @param out Destination block
inline void extract_windowed_frame(const float* samples, int index, int hop_length,
                                   const std::vector<float>& window, std::vector<float>& out) {
  const size_t start = static_cast<size_t>(index) * static_cast<size_t>(hop_length);
  out.resize(window.size());
  for (size_t i = 0; i < window.size(); ++i) {
    out[i] = samples[start + i] * window[i];
  }
}

}  // namespace keybeat
