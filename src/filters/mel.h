#pragma once

/// @file mel.h
/// @brief Mel filterbank for band energies.

#include <vector>

#include "util/constants.h"

namespace keybeat {

/// @brief Configuration for the Mel filterbank.
struct MelFilterConfig {
  int n_mels = tempo_constants::kNumMelBands;  ///< Number of Mel bands
  float fmin = 0.0f;                           ///< Minimum frequency in Hz
  float fmax = 0.0f;                           ///< Maximum frequency in Hz (0 = sr/2)
};

/// @brief Converts Hz to Mel (Slaney scale: linear below 1 kHz, logarithmic above).
float hz_to_mel(float hz);

/// @brief Converts Mel to Hz (inverse of hz_to_mel).
float mel_to_hz(float mel);

/// @brief Computes Mel frequency points.
/// @param n_mels Number of Mel bands
/// @param fmin Minimum frequency in Hz
/// @param fmax Maximum frequency in Hz
/// @return n_mels + 2 band edges in Hz, equally spaced on the Mel scale
std::vector<float> mel_frequencies(int n_mels, float fmin, float fmax);

/// @brief Creates the Mel filterbank matrix.
/// @details Row m is a triangle from edge m to edge m + 2 peaking at edge m + 1, scaled by
///          2 / (f[m + 2] - f[m]) (Slaney area normalization).
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @param config Filterbank configuration
/// @return Matrix [n_mels x (n_fft/2 + 1)] in row-major order
/// @throws KeybeatException(InvalidParameter) if sr, n_fft or n_mels is not positive, or the
///         frequency range is empty or above sr/2
std::vector<float> create_mel_filterbank(int sr, int n_fft,
                                         const MelFilterConfig& config = MelFilterConfig());

}  // namespace keybeat
