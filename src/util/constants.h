#pragma once

/// @file constants.h
/// @brief Build-time analysis constants shared by the detectors.
/// @details These are the defaults of TempoConfig and KeyConfig. Tune here, not at call sites.

namespace keybeat {

/// @brief Constants for onset envelope and tempo estimation.
namespace tempo_constants {
/// @brief Analysis frame size in samples (power of two).
constexpr int kFrameSize = 2048;

/// @brief Hop between frames in samples (< kFrameSize for overlap).
constexpr int kHopSize = 512;

/// @brief Lowest tempo searched.
constexpr float kBpmMin = 60.0f;

/// @brief Highest tempo searched.
constexpr float kBpmMax = 200.0f;

/// @brief Mel bands of the onset envelope.
constexpr int kNumMelBands = 40;

/// @brief Dynamic range in dB kept below the loudest band before taking the log.
constexpr float kTopDb = 80.0f;

/// @brief Mean log-power rise per band below which a frame counts as no onset.
/// @details 0.5 is about 2.2 dB over all bands. Steady chords stay below 0.1, note and drum
///          onsets rise by several units.
constexpr float kOnsetThreshold = 0.5f;
}  // namespace tempo_constants

/// @brief Constants for chromagram extraction and key estimation.
namespace key_constants {
/// @brief Analysis block size in samples (power of two, larger for pitch resolution).
constexpr int kFrameSize = 8192;

/// @brief Hop between blocks in samples.
constexpr int kHopSize = 2048;

/// @brief Bins below this frequency are ignored (sub-bass noise).
constexpr float kMinFrequency = 65.0f;

/// @brief Bins above this frequency are ignored (beyond musical pitch range).
constexpr float kMaxFrequency = 5000.0f;

/// @brief Reference pitch for pitch-class folding: C4 in Hz (pitch class 0).
constexpr float kReferenceFrequency = 261.6255653f;

/// @brief Number of pitch classes.
constexpr int kNumPitchClasses = 12;

/// @brief Chromagrams flatter than this carry no key (clicks, drums, noise).
/// @details Sustained tones measure below 0.001, a click track about 0.58.
constexpr float kMaxTonalFlatness = 0.4f;
}  // namespace key_constants

}  // namespace keybeat
