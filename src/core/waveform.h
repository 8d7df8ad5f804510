#pragma once

/// @file waveform.h
/// @brief Peak reduction of a buffer for waveform display.

#include <vector>

#include "core/sample_buffer.h"

namespace keybeat {

/// @brief Default number of waveform points.
constexpr int kDefaultWaveformPoints = 200;

/// @brief Reduces channel 0 to per-block absolute peaks.
/// @details The channel is split into `points` blocks of floor(size / points) samples; each
///          output value is the largest absolute sample of its block. Trailing samples that do
///          not fill a block are ignored, and a buffer shorter than `points` yields zeros.
/// @param buffer Input buffer
/// @param points Number of output values
/// @return Peaks in [0, max |x|] (empty for an empty buffer or points <= 0)
std::vector<float> waveform_peaks(const SampleBuffer& buffer, int points = kDefaultWaveformPoints);

}  // namespace keybeat
