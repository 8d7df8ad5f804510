#pragma once

/// @file chroma.h
/// @brief Whole-signal 12-bin chromagram.

#include <array>
#include <cstddef>

#include "core/fft.h"
#include "core/sample_buffer.h"
#include "filters/chroma.h"
#include "util/cancellation.h"
#include "util/constants.h"
#include "util/types.h"

namespace keybeat {

/// @brief Configuration for chromagram computation.
struct ChromaConfig {
  int n_fft = key_constants::kFrameSize;       ///< Block size (power of two)
  int hop_length = key_constants::kHopSize;    ///< Hop between blocks
  WindowType window = WindowType::Hann;        ///< Analysis window
  ChromaFoldConfig fold;                       ///< Frequency limits and reference pitch
};

/// @brief Pitch-class energy accumulated over every analyzed block.
/// @details Values are normalized to sum to 1 unless the input carried no energy in the
///          folded frequency range, in which case all values are 0 and silent() is true.
///          flatness() tells pitched input (near 0) from clicks and noise (above 0.5).
class Chromagram {
 public:
  /// @brief Creates a silent chromagram (all zeros).
  Chromagram();

  /// @brief Computes the chromagram of a mono signal.
  /// @param samples Mono signal
  /// @param size Number of samples
  /// @param sr Sample rate in Hz
  /// @param fft FFT engine
  /// @param config Chroma configuration
  /// @param cancel Optional cancellation token, polled once per block
  /// @return Chromagram (silent if the signal is shorter than one block)
  static Chromagram compute(const float* samples, size_t size, int sr, const FFT& fft,
                            const ChromaConfig& config = ChromaConfig(),
                            const CancellationToken* cancel = nullptr);

  /// @brief Computes the chromagram of the channel average of a buffer.
  static Chromagram compute(const SampleBuffer& buffer, const FFT& fft,
                            const ChromaConfig& config = ChromaConfig(),
                            const CancellationToken* cancel = nullptr);

  /// @brief Builds a chromagram from raw per-pitch-class energy.
  /// @param energy Non-negative energy per pitch class
  static Chromagram from_energy(const std::array<float, 12>& energy, int n_frames = 1);

  /// @brief Returns normalized values (C..B).
  const std::array<float, 12>& values() const { return values_; }

  /// @brief Returns the normalized value of one pitch class.
  float operator[](int pc) const { return values_[pc]; }

  /// @brief Returns accumulated energy before normalization.
  float total_energy() const { return total_energy_; }

  /// @brief Spectral flatness of the accumulated magnitudes over the folded bins.
  /// @return Geometric over arithmetic mean in [0, 1]; 0 for silence and from_energy()
  float flatness() const { return flatness_; }

  /// @brief Returns the number of blocks that contributed.
  int n_frames() const { return n_frames_; }

  /// @brief Returns true if no energy was accumulated.
  bool silent() const { return total_energy_ <= 0.0f; }

  /// @brief Returns the pitch class with the largest value (C if silent).
  PitchClass dominant() const;

 private:
  std::array<float, 12> values_;
  float total_energy_;
  float flatness_;
  int n_frames_;
};

}  // namespace keybeat
