#pragma once

/// @file window.h
/// @brief Window function generators.

#include <vector>

#include "util/types.h"

namespace keybeat {

/// @brief Hann coefficient for sample i of an n-sample block.
/// @return 0.5 * (1 - cos(2*pi*i / (n-1))), in [0, 1]; 1 when n == 1
float hann(int i, int n);

/// @brief Hamming coefficient for sample i of an n-sample block.
/// @return 0.54 - 0.46 * cos(2*pi*i / (n-1)), in [0.08, 1]; 1 when n == 1
float hamming(int i, int n);

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> create_window(WindowType type, int length);

/// @brief Returns a cached window of the specified type (thread-local cache).
/// @param type Window type
/// @param length Window length in samples
/// @return Const reference to cached window coefficients
/// @details More efficient for repeated calls with the same parameters (every analysis
///          frame uses the same window). Thread-local, so concurrent detectors never share it.
const std::vector<float>& get_window_cached(WindowType type, int length);

/// @brief Creates a Hann (raised cosine) window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> hann_window(int length);

/// @brief Creates a Hamming window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> hamming_window(int length);

/// @brief Multiplies a block by a window in place.
/// @param block Samples (length must equal window length)
/// @param window Window coefficients
void apply_window(std::vector<float>& block, const std::vector<float>& window);

}  // namespace keybeat
