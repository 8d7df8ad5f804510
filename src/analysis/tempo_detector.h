#pragma once

/// @file tempo_detector.h
/// @brief Tempo (BPM) estimation from onset-envelope autocorrelation.
///
/// @section tempo_algorithm Algorithm Overview
///
/// 1. Log-Mel spectral-flux onset envelope (see feature/onset.h).
/// 2. Linear autocorrelation of the mean-removed envelope, computed with the FFT engine
///    (zero padded to at least twice the length, so no circular wrap-around).
/// 3. Each local maximum inside the lag window of [bpm_min, bpm_max] is scored by its value
///    plus its larger positive neighbour, and the best score wins. A period that falls
///    between two integer lags splits its peak over both, and the neighbour term keeps such
///    a peak from losing to the sharper one at twice the period. Ties go to the smaller lag
///    (the faster tempo).
/// 4. The integer lag is refined by parabolic interpolation and converted with
///    bpm = 60 * sr / (hop * lag), then folded by octaves into [bpm_min, bpm_max].
/// 5. Confidence = autocorrelation at the chosen lag / autocorrelation at lag 0.
///
/// Half/double tempo errors (e.g. 60 or 240 for a 120 BPM track) are an accepted
/// ambiguity of this method and are not corrected beyond the octave fold.

#include <cstddef>
#include <memory>
#include <vector>

#include "core/fft.h"
#include "core/sample_buffer.h"
#include "feature/onset.h"
#include "util/cancellation.h"
#include "util/constants.h"
#include "util/types.h"

namespace keybeat {

/// @brief Configuration for tempo detection.
struct TempoConfig {
  int frame_size = tempo_constants::kFrameSize;              ///< FFT frame size for the envelope
  int hop_length = tempo_constants::kHopSize;                ///< Hop between envelope frames
  float bpm_min = tempo_constants::kBpmMin;                  ///< Slowest tempo searched
  float bpm_max = tempo_constants::kBpmMax;                  ///< Fastest tempo searched
  float onset_threshold = tempo_constants::kOnsetThreshold;  ///< Envelope gate
  WindowType window = WindowType::Hann;                      ///< Analysis window

  /// @brief Returns the matching onset envelope configuration.
  OnsetConfig onset_config() const;
};

/// @brief Tempo estimate.
/// @details bpm == 0 and confidence == 0 mean "no tempo found" (too short, silent, or no
///          periodic onsets).
struct TempoEstimate {
  float bpm = 0.0f;         ///< Beats per minute
  float confidence = 0.0f;  ///< Confidence [0, 1]

  /// @brief Returns true if a tempo was found.
  bool detected() const { return bpm > 0.0f; }
};

/// @brief Autocorrelation peak inside the tempo lag window.
struct TempoCandidate {
  float bpm;       ///< Tempo of the peak (octave folded)
  float strength;  ///< Normalized autocorrelation at the peak [0, 1]
  int lag;         ///< Lag in frames
};

/// @brief Converts a lag (in envelope frames) to BPM.
/// @return 60 * sr / (hop_length * lag), or 0 if lag <= 0
float lag_to_bpm(float lag, int sr, int hop_length);

/// @brief Converts BPM to a (fractional) lag in envelope frames.
/// @return 60 * sr / (hop_length * bpm), or 0 if bpm <= 0
float bpm_to_lag(float bpm, int sr, int hop_length);

/// @brief Doubles or halves a tempo until it lies in [bpm_min, bpm_max].
/// @details Stops doubling at bpm_min and halving at bpm_max; if the range is narrower than
///          an octave the result may stay below bpm_min. Non-positive input returns 0.
float fold_tempo_octave(float bpm, float bpm_min, float bpm_max);

/// @brief Linear autocorrelation r[lag] = sum_i x[i] * x[i + lag].
/// @details Computed as IFFT(|FFT(x)|^2) with zero padding to a power of two >= 2n.
/// @param signal Input signal
/// @param max_lag Largest lag wanted
/// @param fft FFT engine
/// @return Values for lags 0..min(max_lag, n - 1) (empty for an empty signal)
std::vector<float> autocorrelate(const std::vector<float>& signal, int max_lag, const FFT& fft);

/// @brief Tempo detector.
/// @details The estimate is computed once in the constructor; the object is immutable
///          afterwards. Safe to construct concurrently from several threads, including
///          with a shared FFT engine.
class TempoDetector {
 public:
  /// @brief Detects tempo of the channel average of a buffer.
  /// @param buffer Input buffer
  /// @param config Tempo configuration
  /// @throws KeybeatException(InvalidParameter) on bad configuration
  explicit TempoDetector(const SampleBuffer& buffer, const TempoConfig& config = TempoConfig());

  /// @brief Detects tempo of the channel average of a buffer using a given engine.
  /// @param buffer Input buffer
  /// @param config Tempo configuration
  /// @param fft FFT engine (plans are shared through its cache)
  /// @param cancel Optional cancellation token
  /// @throws KeybeatException(Cancelled) if cancelled
  TempoDetector(const SampleBuffer& buffer, const TempoConfig& config, const FFT& fft,
                const CancellationToken* cancel = nullptr);

  /// @brief Detects tempo of a mono signal.
  TempoDetector(const float* samples, size_t size, int sr, const TempoConfig& config,
                const FFT& fft, const CancellationToken* cancel = nullptr);

  /// @brief Detects tempo from a pre-computed onset envelope.
  /// @param envelope Onset envelope (one value per hop)
  /// @param sr Sample rate of the original signal
  /// @param config Tempo configuration (hop_length must match the envelope)
  /// @param fft FFT engine
  TempoDetector(std::vector<float> envelope, int sr, const TempoConfig& config, const FFT& fft);

  /// @brief Returns the tempo estimate.
  const TempoEstimate& estimate() const { return estimate_; }

  /// @brief Returns the estimated BPM (0 if none).
  float bpm() const { return estimate_.bpm; }

  /// @brief Returns confidence of the estimate [0, 1].
  float confidence() const { return estimate_.confidence; }

  /// @brief Returns the integer lag chosen (0 if none).
  int best_lag() const { return best_lag_; }

  /// @brief Returns the onset envelope used.
  const std::vector<float>& envelope() const { return envelope_; }

  /// @brief Returns the autocorrelation of the mean-removed envelope (lag 0 first).
  const std::vector<float>& autocorrelation() const { return autocorr_; }

  /// @brief Returns the strongest autocorrelation peaks.
  /// @param top_n Number of candidates to return
  /// @return Candidates sorted by strength (descending)
  std::vector<TempoCandidate> candidates(int top_n = 5) const;

 private:
  void validate() const;
  void analyze(int sr, const FFT& fft);

  TempoConfig config_;
  TempoEstimate estimate_;
  int best_lag_ = 0;
  std::vector<float> envelope_;
  std::vector<float> autocorr_;
  std::vector<TempoCandidate> candidates_;
};

/// @brief Quick tempo detection.
/// @param buffer Input buffer
/// @param config Tempo configuration
/// @return Tempo estimate
TempoEstimate detect_tempo(const SampleBuffer& buffer, const TempoConfig& config = TempoConfig());

}  // namespace keybeat
