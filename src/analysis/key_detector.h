#pragma once

/// @file key_detector.h
/// @brief Musical key detection by chromagram/profile correlation.

#include <string>
#include <vector>

#include "analysis/camelot.h"
#include "analysis/key_profiles.h"
#include "core/fft.h"
#include "core/sample_buffer.h"
#include "feature/chroma.h"
#include "util/cancellation.h"
#include "util/types.h"

namespace keybeat {

/// @brief Detected musical key.
struct KeyEstimate {
  PitchClass root = PitchClass::C;  ///< Tonic pitch class
  Mode mode = Mode::Major;          ///< Major or Minor
  float score = 0.0f;               ///< Profile correlation of the winning key [-1, 1]
  bool detected = false;            ///< False without pitched energy or for unpitched input

  /// @brief Returns key name (e.g., "C major", "A minor").
  std::string to_string() const;

  /// @brief Returns short key name (e.g., "C", "Am").
  std::string to_short_string() const;

  /// @brief Returns the Camelot code (e.g., "8B").
  std::string camelot() const { return camelot_string(root, mode); }
};

/// @brief Configuration for key detection.
struct KeyConfig {
  ChromaConfig chroma;                                                ///< Chromagram settings
  KeyProfileType profile_type = KeyProfileType::KrumhanslSchmuckler;  ///< Reference profiles
  ProfileMatch match = ProfileMatch::Pearson;                         ///< Similarity measure
  float max_flatness = key_constants::kMaxTonalFlatness;  ///< Unpitched above this, in [0, 1]
};

/// @brief Key detector.
/// @details Scores the chromagram against the 24 rotated major/minor profiles. Ties keep
///          the earlier key in the order C major, C minor, C# major, ... B minor.
///          A chromagram whose flatness() exceeds KeyConfig::max_flatness is unpitched:
///          the key stays at its defaults with detected false and no candidates.
class KeyDetector {
 public:
  /// @brief Detects the key of the channel average of a buffer.
  /// @throws KeybeatException(InvalidParameter) if max_flatness is outside [0, 1]
  explicit KeyDetector(const SampleBuffer& buffer, const KeyConfig& config = KeyConfig());

  /// @brief Detects the key of a buffer using a given engine.
  /// @param buffer Input buffer
  /// @param config Key configuration
  /// @param fft FFT engine (plans are shared through its cache)
  /// @param cancel Optional cancellation token
  /// @throws KeybeatException(Cancelled) if cancelled
  KeyDetector(const SampleBuffer& buffer, const KeyConfig& config, const FFT& fft,
              const CancellationToken* cancel = nullptr);

  /// @brief Detects the key of a mono signal.
  KeyDetector(const float* samples, size_t size, int sr, const KeyConfig& config, const FFT& fft,
              const CancellationToken* cancel = nullptr);

  /// @brief Detects the key from a pre-computed chromagram.
  explicit KeyDetector(const Chromagram& chroma, const KeyConfig& config = KeyConfig());

  /// @brief Returns the detected key.
  const KeyEstimate& key() const { return key_; }

  /// @brief Returns the tonic (C when nothing was detected).
  PitchClass root() const { return key_.root; }

  /// @brief Returns the mode of the detected key.
  Mode mode() const { return key_.mode; }

  /// @brief Returns the winning profile correlation, 0 when nothing was detected.
  float score() const { return key_.score; }

  /// @brief Returns top key candidates.
  /// @param top_n Number of candidates to return
  /// @return Candidates sorted by score (descending)
  std::vector<KeyEstimate> candidates(int top_n = 5) const;

  /// @brief Returns all 24 scored keys, sorted by score (empty if nothing was detected).
  const std::vector<KeyEstimate>& all_candidates() const { return candidates_; }

  /// @brief Returns the chromagram used for analysis.
  const Chromagram& chromagram() const { return chroma_; }

 private:
  void analyze();

  KeyConfig config_;
  Chromagram chroma_;
  KeyEstimate key_;
  std::vector<KeyEstimate> candidates_;
};

/// @brief Quick key detection.
/// @param buffer Input buffer
/// @param config Key configuration
/// @return Detected key (C major, score 0, not detected for silent input)
KeyEstimate detect_key(const SampleBuffer& buffer, const KeyConfig& config = KeyConfig());

}  // namespace keybeat
