#pragma once

/// @file chroma.h
/// @brief Pitch-class folding of FFT bins.

#include <vector>

#include "util/constants.h"

namespace keybeat {

/// @brief Configuration for folding FFT bins into pitch classes.
struct ChromaFoldConfig {
  float fmin = key_constants::kMinFrequency;                ///< Lowest bin frequency used
  float fmax = key_constants::kMaxFrequency;                ///< Highest bin frequency used
  float reference_hz = key_constants::kReferenceFrequency;  ///< Frequency of pitch class 0
};

/// @brief Converts frequency to pitch class (0-11, C=0 with the default reference).
/// @details round(12 * log2(hz / reference_hz)) mod 12, always non-negative.
/// @param hz Frequency in Hz
/// @param reference_hz Frequency of pitch class 0
/// @return Pitch class, or -1 if hz <= 0
int hz_to_pitch_class(float hz, float reference_hz = key_constants::kReferenceFrequency);

/// @brief Pitch class of an FFT bin, honouring the frequency limits.
/// @param bin Bin index
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @param config Fold configuration
/// @return Pitch class, or -1 if the bin lies outside [fmin, fmax]
int bin_pitch_class(int bin, int sr, int n_fft, const ChromaFoldConfig& config = ChromaFoldConfig());

/// @brief Creates the pitch-class fold matrix.
/// @details Entry (pc, k) is 1 if bin k folds into pitch class pc, else 0. Each bin maps
///          to at most one pitch class, so chroma = fold * magnitudes.
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @param config Fold configuration
/// @return Matrix [12 x (n_fft/2 + 1)] in row-major order
/// @throws KeybeatException if sr <= 0, n_fft <= 0 or fmin >= fmax
std::vector<float> create_chroma_fold_matrix(int sr, int n_fft,
                                             const ChromaFoldConfig& config = ChromaFoldConfig());

}  // namespace keybeat
