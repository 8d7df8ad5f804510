#pragma once

/// @file onset.h
/// @brief Log-Mel spectral-flux onset envelope.

#include <cstddef>
#include <vector>

#include "core/fft.h"
#include "util/cancellation.h"
#include "util/constants.h"
#include "util/types.h"

namespace keybeat {

/// @brief Configuration for onset envelope computation.
struct OnsetConfig {
  int frame_size = tempo_constants::kFrameSize;       ///< FFT frame size (power of two)
  int hop_length = tempo_constants::kHopSize;         ///< Hop between frames
  WindowType window = WindowType::Hann;               ///< Analysis window
  int n_mels = tempo_constants::kNumMelBands;         ///< Mel bands
  float top_db = tempo_constants::kTopDb;             ///< Dynamic range kept below the peak band
  float threshold = tempo_constants::kOnsetThreshold;  ///< Gate on the mean log-power rise
};

/// @brief Mean half-wave rectified rise of log Mel power per frame (ungated).
/// @details Band power p[m, t] is floored at max(p) * 10^(-top_db / 10), then
///          flux[t] = mean_m max(0, log p[m, t] - log p[m, t - 1]) and flux[0] = 0.
///          Values are in natural-log units, so a rise of 1.0 in every band is about 4.3 dB.
/// @param samples Mono signal
/// @param size Number of samples
/// @param sr Sample rate in Hz
/// @param fft FFT engine
/// @param config Onset configuration
/// @param cancel Optional cancellation token, polled once per frame
/// @return One value per frame (empty if the signal is shorter than one frame)
/// @throws KeybeatException(InvalidParameter) on bad configuration or sample rate,
///         KeybeatException(Cancelled) if cancelled
std::vector<float> compute_log_mel_flux(const float* samples, size_t size, int sr, const FFT& fft,
                                        const OnsetConfig& config = OnsetConfig(),
                                        const CancellationToken* cancel = nullptr);

/// @brief Computes the onset (novelty) envelope.
/// @details compute_log_mel_flux with values below config.threshold set to 0. All values
///          are non-negative and the length is count_frames(size, frame_size, hop_length).
///          Silence and steady tones or chords yield all zeros.
/// @param samples Mono signal
/// @param size Number of samples
/// @param sr Sample rate in Hz
/// @param fft FFT engine
/// @param config Onset configuration
/// @param cancel Optional cancellation token
/// @return Onset envelope
std::vector<float> compute_onset_envelope(const float* samples, size_t size, int sr,
                                          const FFT& fft,
                                          const OnsetConfig& config = OnsetConfig(),
                                          const CancellationToken* cancel = nullptr);

}  // namespace keybeat
